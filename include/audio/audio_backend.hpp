#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace agent_notifier::audio {

// Interleaved signed 16-bit PCM.
struct Samples {
  std::uint32_t sample_rate{0};
  std::uint16_t channels{0};
  std::vector<std::int16_t> pcm{};

  [[nodiscard]] std::size_t frames() const { return channels == 0 ? 0 : pcm.size() / channels; }
};

class AudioOutput {
 public:
  // Blocks until playback finished. Throws std::runtime_error on failure.
  virtual void play_and_wait(const Samples& samples) = 0;
  virtual ~AudioOutput() = default;
};

class AudioBackend {
 public:
  // Throws std::runtime_error when no output device is available.
  virtual std::unique_ptr<AudioOutput> open_default_output() = 0;
  // Throws std::invalid_argument for unsupported or corrupt data.
  virtual Samples decode(const std::vector<std::uint8_t>& bytes) const = 0;
  virtual ~AudioBackend() = default;
};

std::unique_ptr<AudioBackend> make_pipewire_backend(const char* app_name);
std::unique_ptr<AudioBackend> make_none_backend();

// RIFF/WAVE, PCM format tag 1, 16 bits per sample.
Samples decode_wav(const std::vector<std::uint8_t>& bytes);
std::vector<std::uint8_t> encode_wav(const Samples& samples);

// Built-in notification sound: a short decaying two-tone ping as a WAV file.
std::vector<std::uint8_t> make_ping_wav();

}  // namespace agent_notifier::audio
