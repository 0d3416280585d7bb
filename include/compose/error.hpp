// error.hpp - compose error type with a cause chain
#pragma once
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace compose {

// Every failure of a compose run is reported as compose::error. The message passed to the
// constructor is the root cause; outer layers push context on the way up (with_context) so the
// final report reads outermost first, like "failed to process entries: failed to process file
// a.rs: unpaired 'end_private' on line 2".
struct error : std::runtime_error {
    explicit error(const std::string& cause, int line = -1)
        : std::runtime_error(cause), line_(line) {}

    // Prepend one layer of context. Returns *this so callers can `throw e.with_context(..)`.
    error& with_context(std::string ctx) { context_.push_back(std::move(ctx)); return *this; }

    // Messages outermost first, root cause last.
    std::vector<std::string> chain() const {
        std::vector<std::string> out(context_.rbegin(), context_.rend());
        out.emplace_back(what());
        return out;
    }

    // 1-based source line of the root cause, -1 when not tied to a line.
    int line() const { return line_; }
    void set_line(int l) { line_ = l; }

private:
    int line_;
    std::vector<std::string> context_; // innermost first
};

// Human readable single-line rendering: "outer: inner: cause".
std::string format_error(const error& e);

// Runs fn; a compose::error escaping it gets `ctx` pushed as context. Any other std::exception
// (std::bad_alloc aside) is converted so that the chain is preserved for reporting.
template<typename Fn>
auto with_context(const std::string& ctx, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (error& e) {
        e.with_context(ctx);
        throw;
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        error wrapped(e.what());
        wrapped.with_context(ctx);
        throw wrapped;
    }
}

} // namespace compose
