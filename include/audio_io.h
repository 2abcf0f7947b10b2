#pragma once

#include "common.h"
#include "clock.h"
#include "config.h"
#include "errors.h"
#include <string>
#include <memory>
#include <functional>

namespace luna_voice {

using FrameCallback = std::function<void(const AudioFrame&)>;
using PlaybackCallback = std::function<void()>;

/**
 * @brief Microphone capability: a continuous stream of AudioFrames
 *
 * Between open() and close() the implementation holds the input device
 * exclusively. Frames are delivered on the implementation's own thread;
 * the receiver must hand them to the event loop.
 */
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    /**
     * @brief Acquire the input device and start delivering frames
     * @return MicrophoneAccess if the device cannot be opened,
     *         PermissionDenied if the OS refused access
     */
    virtual VoidResult open(const AudioConfig& config, FrameCallback on_frame) = 0;

    /// Stop the stream and release the device; safe to call twice
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief Scoped ownership of an open capture device
 *
 * close() runs on every exit path unless release() handed ownership on.
 */
class CaptureGuard {
public:
    explicit CaptureGuard(AudioCapture& capture) : capture_(&capture) {}
    ~CaptureGuard() {
        if (capture_) {
            capture_->close();
        }
    }

    CaptureGuard(const CaptureGuard&) = delete;
    CaptureGuard& operator=(const CaptureGuard&) = delete;

    void release() { capture_ = nullptr; }

private:
    AudioCapture* capture_;
};

/**
 * @brief Speaker capability for synthesized speech
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    virtual VoidResult open(const AudioConfig& config) = 0;
    virtual void close() = 0;

    /**
     * @brief Replace anything queued with `buffer` and start playing it
     *
     * on_complete fires once, from the audio thread, after the last sample
     * was handed to the device. It does not fire after stop().
     */
    virtual VoidResult play(const AudioBuffer& buffer, int sample_rate, PlaybackCallback on_complete) = 0;

    /// Stop playback immediately and drop the queue (synchronous)
    virtual void stop() = 0;

    virtual bool is_playing() const = 0;
};

/**
 * @brief PortAudio microphone
 *
 * Thread Safety:
 * - The frame callback runs in PortAudio's thread
 * - open()/close() are called from the event loop thread
 */
class PortAudioCapture : public AudioCapture {
public:
    explicit PortAudioCapture(Clock& clock);
    ~PortAudioCapture() override;

    // Non-copyable
    PortAudioCapture(const PortAudioCapture&) = delete;
    PortAudioCapture& operator=(const PortAudioCapture&) = delete;

    VoidResult open(const AudioConfig& config, FrameCallback on_frame) override;
    void close() override;
    bool is_open() const override;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief PortAudio speaker with a frame-sized playback queue
 */
class PortAudioOutput : public AudioOutput {
public:
    PortAudioOutput();
    ~PortAudioOutput() override;

    // Non-copyable
    PortAudioOutput(const PortAudioOutput&) = delete;
    PortAudioOutput& operator=(const PortAudioOutput&) = delete;

    VoidResult open(const AudioConfig& config) override;
    void close() override;
    VoidResult play(const AudioBuffer& buffer, int sample_rate, PlaybackCallback on_complete) override;
    void stop() override;
    bool is_playing() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
