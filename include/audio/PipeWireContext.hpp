#pragma once

struct pw_thread_loop;

namespace kitsune::audio {

// Owns the PipeWire thread loop; its thread is the sink's render thread.
class PipeWireContext {
public:
    PipeWireContext();
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
};

} // namespace kitsune::audio
