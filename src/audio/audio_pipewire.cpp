#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

#include "audio/audio_backend.hpp"

namespace agent_notifier::audio {
namespace {

// Shared between the blocking caller and the PipeWire loop thread; guarded by the thread loop lock.
struct Playback {
  const Samples* samples{nullptr};
  std::size_t next_frame{0};
  bool flushing{false};
  bool finished{false};
  bool failed{false};
  std::string error{};
  pw_thread_loop* loop{nullptr};
  pw_stream* stream{nullptr};
  spa_hook listener{};
  pw_stream_events events{};
};

void on_process(void* userdata) {
  auto* playback = static_cast<Playback*>(userdata);
  pw_buffer* buf = pw_stream_dequeue_buffer(playback->stream);
  if (buf == nullptr) {
    return;
  }

  spa_data& d = buf->buffer->datas[0];
  auto* dst = static_cast<std::int16_t*>(d.data);
  if (dst == nullptr) {
    pw_stream_queue_buffer(playback->stream, buf);
    return;
  }

  const Samples& samples = *playback->samples;
  const std::uint32_t stride = samples.channels * sizeof(std::int16_t);
  std::size_t frames = d.maxsize / stride;
  if (buf->requested > 0) {
    frames = std::min<std::size_t>(frames, buf->requested);
  }
  frames = std::min(frames, samples.frames() - playback->next_frame);

  std::memcpy(dst, samples.pcm.data() + (playback->next_frame * samples.channels), frames * stride);
  playback->next_frame += frames;

  d.chunk->offset = 0;
  d.chunk->stride = static_cast<std::int32_t>(stride);
  d.chunk->size = static_cast<std::uint32_t>(frames * stride);
  pw_stream_queue_buffer(playback->stream, buf);

  if (playback->next_frame >= samples.frames() && !playback->flushing) {
    playback->flushing = true;
    pw_stream_flush(playback->stream, true);
  }
}

void on_drained(void* userdata) {
  auto* playback = static_cast<Playback*>(userdata);
  playback->finished = true;
  pw_thread_loop_signal(playback->loop, false);
}

void on_state_changed(void* userdata, pw_stream_state /*old*/, pw_stream_state state, const char* error) {
  auto* playback = static_cast<Playback*>(userdata);
  if (state == PW_STREAM_STATE_ERROR) {
    playback->failed = true;
    playback->error = error != nullptr ? error : "stream error";
    pw_thread_loop_signal(playback->loop, false);
  }
}

class PipeWireOutput final : public AudioOutput {
 public:
  explicit PipeWireOutput(const char* app_name) : app_name_(app_name) {
    loop_ = pw_thread_loop_new("agent-notifier-sound", nullptr);
    if (loop_ == nullptr) {
      throw std::runtime_error("failed to create PipeWire thread loop");
    }

    pw_thread_loop_lock(loop_);
    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (context_ != nullptr) {
      core_ = pw_context_connect(context_, nullptr, 0);
    }
    pw_thread_loop_unlock(loop_);

    if (context_ == nullptr || core_ == nullptr) {
      release();
      throw std::runtime_error("failed to connect to the PipeWire daemon");
    }

    if (pw_thread_loop_start(loop_) < 0) {
      release();
      throw std::runtime_error("failed to start PipeWire thread loop");
    }
  }

  ~PipeWireOutput() override { release(); }

  PipeWireOutput(const PipeWireOutput&) = delete;
  PipeWireOutput& operator=(const PipeWireOutput&) = delete;

  void play_and_wait(const Samples& samples) override {
    if (samples.frames() == 0) {
      return;
    }

    Playback playback;
    playback.samples = &samples;
    playback.loop = loop_;
    playback.events.version = PW_VERSION_STREAM_EVENTS;
    playback.events.state_changed = &on_state_changed;
    playback.events.process = &on_process;
    playback.events.drained = &on_drained;

    pw_thread_loop_lock(loop_);

    auto* props = pw_properties_new(PW_KEY_MEDIA_TYPE, "Audio", PW_KEY_MEDIA_CATEGORY, "Playback", PW_KEY_MEDIA_ROLE,
                                    "Notification", PW_KEY_APP_NAME, app_name_.c_str(), nullptr);
    playback.stream = pw_stream_new(core_, "notification-sound", props);
    if (playback.stream == nullptr) {
      pw_thread_loop_unlock(loop_);
      throw std::runtime_error("failed to create PipeWire stream");
    }
    pw_stream_add_listener(playback.stream, &playback.listener, &playback.events, &playback);

    std::uint8_t param_buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(param_buf, sizeof(param_buf));
    spa_audio_info_raw raw_info{};
    raw_info.format = SPA_AUDIO_FORMAT_S16_LE;
    raw_info.rate = samples.sample_rate;
    raw_info.channels = samples.channels;
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &raw_info);

    const int ret = pw_stream_connect(
        playback.stream, PW_DIRECTION_OUTPUT, PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS),
        params, 1);
    if (ret < 0) {
      spa_hook_remove(&playback.listener);
      pw_stream_destroy(playback.stream);
      pw_thread_loop_unlock(loop_);
      throw std::runtime_error("failed to connect PipeWire stream: " + std::to_string(ret));
    }

    while (!playback.finished && !playback.failed) {
      pw_thread_loop_wait(loop_);
    }

    spa_hook_remove(&playback.listener);
    pw_stream_destroy(playback.stream);
    pw_thread_loop_unlock(loop_);

    if (playback.failed) {
      throw std::runtime_error("PipeWire playback failed: " + playback.error);
    }
  }

 private:
  void release() {
    if (loop_ != nullptr) {
      pw_thread_loop_stop(loop_);
    }
    if (core_ != nullptr) {
      pw_core_disconnect(core_);
      core_ = nullptr;
    }
    if (context_ != nullptr) {
      pw_context_destroy(context_);
      context_ = nullptr;
    }
    if (loop_ != nullptr) {
      pw_thread_loop_destroy(loop_);
      loop_ = nullptr;
    }
  }

  std::string app_name_;
  pw_thread_loop* loop_{nullptr};
  pw_context* context_{nullptr};
  pw_core* core_{nullptr};
};

class PipeWireBackend final : public AudioBackend {
 public:
  explicit PipeWireBackend(const char* app_name) : app_name_(app_name) { pw_init(nullptr, nullptr); }

  ~PipeWireBackend() override { pw_deinit(); }

  PipeWireBackend(const PipeWireBackend&) = delete;
  PipeWireBackend& operator=(const PipeWireBackend&) = delete;

  std::unique_ptr<AudioOutput> open_default_output() override {
    return std::make_unique<PipeWireOutput>(app_name_.c_str());
  }

  Samples decode(const std::vector<std::uint8_t>& bytes) const override { return decode_wav(bytes); }

 private:
  std::string app_name_;
};

}  // namespace

std::unique_ptr<AudioBackend> make_pipewire_backend(const char* app_name) {
  return std::make_unique<PipeWireBackend>(app_name);
}

}  // namespace agent_notifier::audio
