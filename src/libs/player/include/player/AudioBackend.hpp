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

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jukebox::core
{
    class IChildProcessManager;
}

namespace jukebox::player
{
    // Output driver preference passed to the player at startup
    enum class AudioBackend
    {
        EmbeddedAlsa, // Raspberry Pi like boards
        PipeWire,
        PulseAudio,
        Default,
    };

    struct AudioBackendDetectionParameters
    {
        std::filesystem::path cpuInfoPath{ "/proc/cpuinfo" };
        std::filesystem::path pactlPath{ "/usr/bin/pactl" };
        std::chrono::milliseconds pactlTimeout{ 2000 };
    };

    std::string_view getAudioBackendName(AudioBackend backend);

    bool isEmbeddedPlatform(std::string_view cpuInfo);

    // audioServerInfo: output of 'pactl info' if it succeeded
    AudioBackend selectAudioBackend(bool embeddedPlatform, const std::optional<std::string>& audioServerInfo);

    std::vector<std::string> getAudioBackendArgs(AudioBackend backend);

    // Never throws, falls back to AudioBackend::Default
    AudioBackend detectAudioBackend(core::IChildProcessManager& childProcessManager, const AudioBackendDetectionParameters& params);
} // namespace jukebox::player
