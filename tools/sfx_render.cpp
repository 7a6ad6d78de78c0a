// ==============================================================================
// Sound Effect Renderer
// ==============================================================================
// Renders one sound effect to headerless 32-bit float mono PCM at 44.1 kHz.
//
// Usage:
//   sfx_render [preset] [--seed N] [--mutate N] [--wave square|triangle|sine|noise]
//              [--set name=value]... [--volume V] [--seconds S]
//              [--noise-seed N] [--output path|-]
//   sfx_render --list
//
// Play the result with:
//   aplay -f FLOAT_LE -c1 -r44100 effect.raw
// ==============================================================================

#include <sfxr/dsp/core/math_constants.h>
#include <sfxr/dsp/core/sfx_params.h>
#include <sfxr/dsp/core/sfx_presets.h>
#include <sfxr/dsp/systems/sfx_generator.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace Sfxr::DSP;

namespace {

constexpr size_t kBlockSize = 4096;
constexpr float kMaxSeconds = 600.0f;

struct Options {
    std::string preset;
    uint32_t seed = 0;
    std::optional<uint32_t> mutateSeed;
    std::optional<WaveType> wave;
    std::vector<std::pair<std::string, float>> overrides;
    float volume = kDefaultSfxVolume;
    std::optional<float> seconds;
    uint32_t noiseSeed = kDefaultNoiseSeed;
    std::string output = "-";
    bool list = false;
};

void printUsage() {
    std::cerr << "Usage: sfx_render [preset] [--seed N] [--mutate N]"
                 " [--wave square|triangle|sine|noise]\n"
                 "                  [--set name=value]... [--volume V] [--seconds S]\n"
                 "                  [--noise-seed N] [--output path|-]\n"
                 "       sfx_render --list\n"
                 "Presets:";
    for (auto name : Presets::kPresetNames) {
        std::cerr << ' ' << name;
    }
    std::cerr << std::endl;
}

bool parseUnsigned(const std::string& text, uint32_t& out) {
    if (text.empty() || text[0] == '-') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long value = std::strtoul(text.c_str(), &end, 0);
    if (errno != 0 || *end != '\0' || value > UINT32_MAX) return false;
    out = static_cast<uint32_t>(value);
    return true;
}

bool parseFloat(const std::string& text, float& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const float value = std::strtof(text.c_str(), &end);
    if (errno != 0 || *end != '\0') return false;
    out = value;
    return true;
}

bool takesValue(std::string_view arg) {
    return arg == "--seed" || arg == "--mutate" || arg == "--noise-seed"
        || arg == "--wave" || arg == "--set" || arg == "--volume"
        || arg == "--seconds" || arg == "--output" || arg == "-o";
}

/// Parse argv into options. Returns false after reporting the problem.
bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        std::string text;
        if (takesValue(arg)) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            text = argv[++i];
        }

        if (arg == "--list") {
            options.list = true;
        } else if (arg == "--seed") {
            if (!parseUnsigned(text, options.seed)) {
                std::cerr << "Invalid seed: " << text << std::endl;
                return false;
            }
        } else if (arg == "--mutate") {
            uint32_t seed = 0;
            if (!parseUnsigned(text, seed)) {
                std::cerr << "Invalid mutate seed: " << text << std::endl;
                return false;
            }
            options.mutateSeed = seed;
        } else if (arg == "--noise-seed") {
            if (!parseUnsigned(text, options.noiseSeed)) {
                std::cerr << "Invalid noise seed: " << text << std::endl;
                return false;
            }
        } else if (arg == "--wave") {
            WaveType wave = WaveType::Square;
            if (!parseWaveType(text, wave)) {
                std::cerr << "Unknown wave type: " << text << std::endl;
                return false;
            }
            options.wave = wave;
        } else if (arg == "--set") {
            const auto eq = text.find('=');
            float parsed = 0.0f;
            if (eq == std::string::npos || !parseFloat(text.substr(eq + 1), parsed)) {
                std::cerr << "Expected name=value, got: " << text << std::endl;
                return false;
            }
            options.overrides.emplace_back(text.substr(0, eq), parsed);
        } else if (arg == "--volume") {
            if (!parseFloat(text, options.volume)) {
                std::cerr << "Invalid volume: " << text << std::endl;
                return false;
            }
        } else if (arg == "--seconds") {
            float seconds = 0.0f;
            if (!parseFloat(text, seconds) || !(seconds >= 0.0f && seconds <= kMaxSeconds)) {
                std::cerr << "Seconds must be between 0 and " << kMaxSeconds << std::endl;
                return false;
            }
            options.seconds = seconds;
        } else if (arg == "--output" || arg == "-o") {
            options.output = text;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return false;
        } else if (options.preset.empty()) {
            options.preset = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

void listParameters() {
    const SfxParams defaults;
    std::cout << std::left << std::setw(16) << "name"
              << std::right << std::setw(8) << "min"
              << std::setw(8) << "max"
              << std::setw(10) << "default" << "\n";
    for (const auto& info : kSfxParamTable) {
        std::cout << std::left << std::setw(16) << info.name
                  << std::right << std::setw(8) << info.minValue
                  << std::setw(8) << info.maxValue
                  << std::setw(10) << info.get(defaults) << "\n";
    }
    std::cout << std::left << std::setw(16) << "wave" << "square|triangle|sine|noise" << std::endl;
}

/// Build the effect from the preset and overrides. Returns false after
/// reporting the problem.
bool buildParams(const Options& options, SfxParams& params) {
    if (!options.preset.empty()
        && !Presets::fromName(options.preset, options.seed, params)) {
        std::cerr << "Unknown preset: " << options.preset << std::endl;
        printUsage();
        return false;
    }

    if (options.mutateSeed) {
        Presets::mutate(params, *options.mutateSeed);
    }

    if (options.wave) {
        params.waveType = *options.wave;
    }

    for (const auto& [name, value] : options.overrides) {
        const auto* info = findSfxParam(name);
        if (info == nullptr) {
            std::cerr << "Unknown parameter: " << name << " (see --list)" << std::endl;
            return false;
        }
        info->set(params, value);
    }
    return true;
}

bool writeSamples(std::ostream& out, SfxGenerator& generator, size_t totalFrames) {
    std::vector<float> block(kBlockSize);
    size_t remaining = totalFrames;

    while (remaining > 0) {
        const size_t count = std::min(remaining, kBlockSize);
        generator.generate(block.data(), count);
        out.write(reinterpret_cast<const char*>(block.data()),
                  static_cast<std::streamsize>(count * sizeof(float)));
        if (!out) return false;
        remaining -= count;
    }
    out.flush();
    return static_cast<bool>(out);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        return 1;
    }

    if (options.list) {
        listParameters();
        return 0;
    }

    SfxParams params;
    if (!buildParams(options, params)) {
        return 1;
    }

    const bool toStdout = options.output == "-";
    // Keep stdout clean for PCM
    std::ostream& status = toStdout ? std::cerr : std::cout;

    try {
        SfxGenerator generator(params, options.noiseSeed);
        generator.setVolume(options.volume);

        const size_t frames = options.seconds
            ? static_cast<size_t>(*options.seconds * static_cast<float>(kSfxSampleRate))
            : static_cast<size_t>(generator.effectLengthFrames());

        bool written = false;
        if (toStdout) {
            written = writeSamples(std::cout, generator, frames);
        } else {
            std::ofstream file(options.output, std::ios::binary);
            if (!file) {
                std::cerr << "Failed to create: " << options.output << std::endl;
                return 1;
            }
            written = writeSamples(file, generator, frames);
        }

        if (!written) {
            std::cerr << "Failed to write samples to " << options.output << std::endl;
            return 1;
        }

        status << "Rendered " << frames << " frames ("
            << static_cast<double>(frames) / kSfxSampleRate << " s, "
            << waveTypeName(params.waveType) << ")";
        if (!toStdout) {
            status << " to " << options.output;
        }
        status << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid effect: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
