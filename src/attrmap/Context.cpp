#include "attrmap/Context.hpp"

#include "spdlog/spdlog.h"

namespace attrmap {

Context::Context(): m_cancelled(std::make_shared<std::atomic<bool>>(false)) {}

Context::Context(Options options): m_cancelled(std::make_shared<std::atomic<bool>>(false)), m_options(options) {}

void Context::cancel() {
    SPDLOG_DEBUG("conversion context cancelled");
    m_cancelled->store(true);
}

void Context::setTimeout(std::chrono::steady_clock::duration timeout) {
    m_deadline = std::chrono::steady_clock::now() + timeout;
}

std::string Context::err() const {
    if (m_cancelled->load()) {
        return "context canceled";
    }
    if (m_deadline && std::chrono::steady_clock::now() >= *m_deadline) {
        return "context deadline exceeded";
    }
    return std::string();
}

} // namespace attrmap
