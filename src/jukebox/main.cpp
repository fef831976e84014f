/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Jukebox.
 *
 * Jukebox is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Jukebox is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Jukebox.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <latch>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "playback/IPlaybackService.hpp"
#include "player/IPlayerChannel.hpp"
#include "player/IPlayerSupervisor.hpp"
#include "resolver/IResolver.hpp"

#include "Console.hpp"
#include "LoggingEventPublisher.hpp"

namespace jukebox
{
    namespace
    {
        // Shutdown can be requested several times, from several threads
        class ShutdownRequest
        {
        public:
            void request(std::string_view reason)
            {
                {
                    const std::scoped_lock lock{ _mutex };
                    if (_requested)
                        return;

                    _requested = true;
                }

                JUKEBOX_LOG(MAIN, INFO, "Shutdown requested: " << reason);
                _cv.notify_all();
            }

            void wait()
            {
                std::unique_lock lock{ _mutex };
                _cv.wait(lock, [this] { return _requested; });
            }

        private:
            std::mutex _mutex;
            std::condition_variable _cv;
            bool _requested{};
        };

        player::PlayerSupervisorParameters getPlayerSupervisorParameters(core::IConfig& config)
        {
            player::PlayerSupervisorParameters params;
            params.playerPath = config.getPath("player-path", "/usr/bin/mpv");
            params.ipcPath = config.getPath("player-ipc-path", "/tmp/mpv.sock");
            params.initialVolume = std::min<unsigned long>(config.getULong("player-initial-volume", 50), 100);
            params.startupAttempts = config.getULong("player-startup-attempts", 10);
            params.startupInterval = std::chrono::milliseconds{ config.getULong("player-startup-interval-ms", 100) };
            params.shutdownGracePeriod = std::chrono::milliseconds{ config.getULong("player-shutdown-grace-ms", 1000) };
            params.responseTimeout = std::chrono::milliseconds{ config.getULong("player-ipc-timeout-ms", 2000) };
            params.restartBackoff = std::chrono::milliseconds{ config.getULong("player-restart-backoff-ms", 5000) };
            params.maxRestartBackoff = std::chrono::milliseconds{ config.getULong("player-max-restart-backoff-ms", 60000) };
            params.audioBackendDetection.cpuInfoPath = config.getPath("cpuinfo-path", "/proc/cpuinfo");
            params.audioBackendDetection.pactlPath = config.getPath("pactl-path", "/usr/bin/pactl");

            return params;
        }

        resolver::ResolverParameters getResolverParameters(core::IConfig& config)
        {
            resolver::ResolverParameters params;
            params.url = config.getString("resolver-url", "https://get-youtube-audio-364938401510.southamerica-east1.run.app");
            params.timeout = std::chrono::seconds{ config.getULong("resolver-timeout-s", 30) };

            return params;
        }

        playback::PlaybackServiceParameters getPlaybackServiceParameters(core::IConfig& config)
        {
            playback::PlaybackServiceParameters params;
            params.autoplay = config.getBool("autoplay", true);
            params.initialVolume = static_cast<double>(std::min<unsigned long>(config.getULong("player-initial-volume", 50), 100));
            params.pollPeriod = std::chrono::milliseconds{ config.getULong("poll-period-ms", 500) };
            params.loadConfirmationTicks = config.getULong("load-confirmation-ticks", 20);

            return params;
        }

        int run(const std::filesystem::path& configFilePath, bool enableConsole)
        {
            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::parseSeverity(config->getString("log-min-severity", "info")), config->getPath("log-file", "")) };

            JUKEBOX_LOG(MAIN, INFO, "Starting jukebox, config file = " << configFilePath);

            boost::asio::io_context ioContext;
            core::IOContextRunner ioContextRunner{ ioContext, std::max<unsigned long>(config->getULong("thread-count", 2), 1), "Jukebox" };

            core::Service<core::IChildProcessManager> childProcessManager{ core::createChildProcessManager() };

            std::unique_ptr<player::IPlayerSupervisor> supervisor{ player::createPlayerSupervisor(*childProcessManager, getPlayerSupervisorParameters(*config)) };
            try
            {
                supervisor->ensureRunning();
            }
            catch (const player::StartupFailedException& e)
            {
                // retried on the next player call
                JUKEBOX_LOG(MAIN, ERROR, "Player startup failed: " << e.what());
            }

            std::unique_ptr<player::IPlayerChannel> channel{ player::createPlayerChannel(*supervisor, std::chrono::milliseconds{ config->getULong("player-ipc-timeout-ms", 2000) }) };
            std::unique_ptr<resolver::IResolver> resolver{ resolver::createResolver(ioContext, getResolverParameters(*config)) };

            LoggingEventPublisher eventPublisher;
            std::unique_ptr<playback::IPlaybackService> playbackService{ playback::createPlaybackService(getPlaybackServiceParameters(*config), *supervisor, *channel, *resolver, eventPublisher) };

            ShutdownRequest shutdownRequest;

            boost::asio::signal_set signals{ ioContext, SIGINT, SIGTERM };
            signals.async_wait([&](const boost::system::error_code& ec, int signalNumber) {
                if (!ec)
                    shutdownRequest.request(signalNumber == SIGINT ? "SIGINT" : "SIGTERM");
            });

            std::optional<Console> console;
            if (enableConsole)
            {
                console.emplace(ioContext, *playbackService, [&] { shutdownRequest.request("console"); });
                try
                {
                    console->start();
                }
                catch (const core::JukeboxException& e)
                {
                    JUKEBOX_LOG(MAIN, ERROR, "Console disabled: " << e.what());
                }
            }

            JUKEBOX_LOG(MAIN, INFO, "Now running...");
            shutdownRequest.wait();

            JUKEBOX_LOG(MAIN, INFO, "Stopping...");
            if (console)
                console->stop();

            {
                std::latch signalsLatch{ 1 };
                boost::asio::post(ioContext, [&] {
                    signals.cancel();
                    signalsLatch.count_down();
                });
                signalsLatch.wait();
            }

            // in flight resolutions are aborted while the service is still alive
            playbackService->shutdown();
            resolver.reset();
            playbackService.reset();
            ioContextRunner.stop();

            channel.reset();
            supervisor->shutdown();

            JUKEBOX_LOG(MAIN, INFO, "Quitting...");
            return EXIT_SUCCESS;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>()->default_value("/etc/jukebox.conf"), "Path to the configuration file")
            ("console", "Read control commands from the standard input");
        // clang-format on

        program_options::variables_map vm;
        try
        {
            program_options::store(program_options::parse_command_line(argc, argv, options), vm);
            program_options::notify(vm);
        }
        catch (const program_options::error& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << "Usage: " << argv[0] << " [options]" << std::endl
                      << options << std::endl;
            return EXIT_FAILURE;
        }

        if (vm.count("help"))
        {
            std::cout << "Usage: " << argv[0] << " [options]" << std::endl
                      << options << std::endl;
            return EXIT_SUCCESS;
        }

        int res{ EXIT_FAILURE };
        try
        {
            res = run(vm["conf"].as<std::string>(), vm.count("console") > 0);
        }
        catch (const std::exception& e)
        {
            JUKEBOX_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace jukebox

int main(int argc, char* argv[])
{
    return jukebox::main(argc, argv);
}
