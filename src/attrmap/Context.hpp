#ifndef SRC_ATTRMAP_CONTEXT_HPP_
#define SRC_ATTRMAP_CONTEXT_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace attrmap {

// Behavior switches for a conversion.
struct Options {
    // When true, a null wire value converted into a native type that cannot represent null leaves the native value in
    // its value-initialized state instead of failing.
    bool unhandledNullAsEmpty = false;
    // Same as above, for unknown wire values.
    bool unhandledUnknownAsEmpty = false;
    // Conversions nested deeper than this many path steps fail.
    int32_t maxDepth = 64;
};

// Passed as the first argument to every conversion call, and on into nested conversions and type hooks. Carries the
// Options and a cancellation signal. Copies share the cancellation state, so cancel() on any copy, from any thread,
// is observed by conversions running with any other copy.
class Context {
public:
    Context();
    explicit Context(Options options);
    ~Context() = default;

    void cancel();
    void setDeadline(std::chrono::steady_clock::time_point deadline) { m_deadline = deadline; }
    void setTimeout(std::chrono::steady_clock::duration timeout);

    // Returns an empty string while the conversion may proceed, otherwise the reason it must stop.
    std::string err() const;
    bool isDone() const { return !err().empty(); }

    const Options& options() const { return m_options; }
    Options& options() { return m_options; }

private:
    std::shared_ptr<std::atomic<bool>> m_cancelled;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
    Options m_options;
};

} // namespace attrmap

#endif // SRC_ATTRMAP_CONTEXT_HPP_
