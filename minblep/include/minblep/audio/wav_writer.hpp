#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace minblep {

struct WavWriteResult {
    bool success;
    std::string error_message;
};

// Minimal RIFF/WAVE writer for 16-bit PCM
class WavWriter {
public:
    // samples are interleaved, num_frames * channels values in [-1, 1]
    static std::vector<std::uint8_t> encode_pcm16(const float* samples, std::uint32_t num_frames,
                                                  std::uint16_t channels, std::uint32_t sample_rate) {
        const std::uint32_t num_samples = num_frames * channels;
        const std::uint32_t data_size = num_samples * 2;

        std::vector<std::uint8_t> data;
        data.reserve(44 + data_size);

        auto put_tag = [&](const char* tag) { data.insert(data.end(), tag, tag + 4); };
        auto put_u16 = [&](std::uint16_t v) {
            data.push_back(v & 0xFF);
            data.push_back((v >> 8) & 0xFF);
        };
        auto put_u32 = [&](std::uint32_t v) {
            for (int i = 0; i < 4; ++i) {
                data.push_back((v >> (i * 8)) & 0xFF);
            }
        };

        put_tag("RIFF");
        put_u32(36 + data_size);
        put_tag("WAVE");

        put_tag("fmt ");
        put_u32(16);
        put_u16(1);  // PCM
        put_u16(channels);
        put_u32(sample_rate);
        put_u32(sample_rate * channels * 2);  // Byte rate
        put_u16(static_cast<std::uint16_t>(channels * 2));  // Block align
        put_u16(16);

        put_tag("data");
        put_u32(data_size);
        for (std::uint32_t i = 0; i < num_samples; ++i) {
            const float clamped = std::clamp(samples[i], -1.0f, 1.0f);
            const auto pcm = static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
            put_u16(static_cast<std::uint16_t>(pcm));
        }

        return data;
    }

    static WavWriteResult write_to_file(const std::string& filepath, const float* samples,
                                        std::uint32_t num_frames, std::uint16_t channels,
                                        std::uint32_t sample_rate) {
        WavWriteResult result{};
        result.success = false;

        if (channels == 0) {
            result.error_message = "Channel count must be positive";
            return result;
        }

        const auto bytes = encode_pcm16(samples, num_frames, channels, sample_rate);

        std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            result.error_message = "Failed to open file: " + filepath;
            return result;
        }

        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            result.error_message = "Failed to write file: " + filepath;
            return result;
        }

        result.success = true;
        return result;
    }
};

}  // namespace minblep
