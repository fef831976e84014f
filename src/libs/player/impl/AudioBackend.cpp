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

#include "player/AudioBackend.hpp"

#include <fstream>
#include <sstream>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#define LOG(sev, message) JUKEBOX_LOG(PLAYER, sev, "[AudioBackend] " << message)

namespace jukebox::player
{
    namespace
    {
        std::optional<std::string> readCpuInfo(const std::filesystem::path& cpuInfoPath)
        {
            std::ifstream ifs{ cpuInfoPath };
            if (!ifs)
            {
                LOG(DEBUG, "Cannot open '" << cpuInfoPath.string() << "'");
                return std::nullopt;
            }

            std::ostringstream oss;
            oss << ifs.rdbuf();
            return oss.str();
        }

        std::optional<std::string> queryAudioServerInfo(core::IChildProcessManager& childProcessManager, const AudioBackendDetectionParameters& params)
        {
            try
            {
                core::ChildProcessResult result{ core::runChildProcess(childProcessManager, params.pactlPath, { "info" }, params.pactlTimeout) };
                if (result.exitCode && *result.exitCode == 0)
                    return std::move(result.output);

                LOG(DEBUG, "'" << params.pactlPath.string() << " info' failed");
            }
            catch (const core::ChildProcessException& e)
            {
                LOG(DEBUG, "Cannot run '" << params.pactlPath.string() << "': " << e.what());
            }

            return std::nullopt;
        }
    } // namespace

    std::string_view getAudioBackendName(AudioBackend backend)
    {
        switch (backend)
        {
        case AudioBackend::EmbeddedAlsa:
            return "embedded (ALSA first)";
        case AudioBackend::PipeWire:
            return "PipeWire";
        case AudioBackend::PulseAudio:
            return "PulseAudio";
        case AudioBackend::Default:
            return "default";
        }

        return "unknown";
    }

    bool isEmbeddedPlatform(std::string_view cpuInfo)
    {
        return core::stringUtils::stringCaseInsensitiveContains(cpuInfo, "raspberry pi")
               || core::stringUtils::stringCaseInsensitiveContains(cpuInfo, "bcm");
    }

    AudioBackend selectAudioBackend(bool embeddedPlatform, const std::optional<std::string>& audioServerInfo)
    {
        if (embeddedPlatform)
            return AudioBackend::EmbeddedAlsa;

        if (audioServerInfo)
        {
            if (core::stringUtils::stringCaseInsensitiveContains(*audioServerInfo, "pipewire"))
                return AudioBackend::PipeWire;

            return AudioBackend::PulseAudio;
        }

        return AudioBackend::Default;
    }

    std::vector<std::string> getAudioBackendArgs(AudioBackend backend)
    {
        switch (backend)
        {
        case AudioBackend::EmbeddedAlsa:
            return { "--ao=alsa,pulse,pipewire,", "--audio-device=auto", "--audio-samplerate=44100", "--audio-format=s16" };
        case AudioBackend::PipeWire:
            return { "--ao=pipewire,pulse,alsa,", "--audio-device=auto" };
        case AudioBackend::PulseAudio:
            return { "--ao=pulse,alsa,", "--audio-device=auto" };
        case AudioBackend::Default:
            break;
        }

        return { "--ao=pulse,alsa,pipewire,", "--audio-device=auto" };
    }

    AudioBackend detectAudioBackend(core::IChildProcessManager& childProcessManager, const AudioBackendDetectionParameters& params)
    {
        const std::optional<std::string> cpuInfo{ readCpuInfo(params.cpuInfoPath) };
        const bool embeddedPlatform{ cpuInfo && isEmbeddedPlatform(*cpuInfo) };

        // the audio server does not matter on embedded platforms
        const std::optional<std::string> audioServerInfo{ embeddedPlatform ? std::nullopt : queryAudioServerInfo(childProcessManager, params) };

        const AudioBackend backend{ selectAudioBackend(embeddedPlatform, audioServerInfo) };
        LOG(INFO, "Detected audio backend: " << getAudioBackendName(backend));

        return backend;
    }
} // namespace jukebox::player
