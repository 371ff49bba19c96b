/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "config/SettingsStore.hpp"
#include "config/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "core/TickClock.hpp"
#include "simulation/SimulationWorld.hpp"
#include "simulation/TickPipeline.hpp"
#include <SDL3/SDL.h>
#include <exception>
#include <iostream>
#include <string>

namespace {

const std::string SETTINGS_FILE {"res/cityscale.json"};

} // namespace

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    if (!SDL_Init(0)) {
        std::cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError() << std::endl;
        return 1;
    }

    CityScale::SettingsStore settings;
    if (!settings.loadFromFile(SETTINGS_FILE)) {
        CITYSCALE_WARN("Main", "Using built-in defaults, could not read " + SETTINGS_FILE);
    }

    int exitCode = 0;
    try {
        const CityScale::SimulationConfig config = CityScale::SimulationConfig::fromSettings(settings);
        CityScale::SimulationWorld world(config, CityScale::CHUNK_SIZE, CityScale::CHUNK_SIZE);

        const std::string tileFile = settings.get<std::string>("world", "tile_file", "res/city.tiles");
        const std::string districtFile = settings.get<std::string>("world", "district_file", "res/city.districts");
        const CityScale::LoadResult tilesLoaded = world.loadTiles(tileFile);
        const CityScale::LoadResult districtsLoaded =
            tilesLoaded == CityScale::LoadResult::SUCCESS ? world.loadDistricts(districtFile) : tilesLoaded;

        if (districtsLoaded != CityScale::LoadResult::SUCCESS) {
            CITYSCALE_CRITICAL("Main", "City data could not be loaded");
            exitCode = 1;
        } else {
            const CityScale::TilePos poi{settings.get<int>("world", "poi_x", world.tiles().width() / 2),
                                         settings.get<int>("world", "poi_y", world.tiles().height() / 2)};
            const int ticks = settings.get<int>("world", "run_ticks", 1000);

            CityScale::TickPipeline pipeline(config);
            CityScale::TickClock clock(config.tick);
            for (int i = 0; i < ticks; ++i) {
                clock.beginTick();
                pipeline.runTick(world, poi);
                clock.endTick();
            }

            CITYSCALE_INFO("Main", "Ran " + std::to_string(ticks) + " ticks, average " +
                           std::to_string(clock.getAverageTickMs()) + " ms, " +
                           std::to_string(clock.getOverrunCount()) + " overruns, " +
                           std::to_string(world.individuals().size()) + " live individuals");
        }
    } catch (const std::exception& e) {
        CITYSCALE_CRITICAL("Main", std::string("Startup failed: ") + e.what());
        exitCode = 1;
    }

    SDL_Quit();
    return exitCode;
}
