#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace kitsune::audio {

PipeWireContext::PipeWireContext() {
}

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // Safe to leave initialized until process exit
}

bool PipeWireContext::init() {
    if (loop_) return true; // Already initialized

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new("kitsune-render", nullptr);

    if (loop_) {
        if (pw_thread_loop_start(loop_) < 0) {
            kitsune::util::Logger::error("PipeWireContext: Failed to start thread loop");
            pw_thread_loop_destroy(loop_);
            loop_ = nullptr;
            return false;
        }
        return true;
    }
    kitsune::util::Logger::error("PipeWireContext: Failed to create thread loop");
    return false;
}

} // namespace kitsune::audio
