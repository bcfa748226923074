#pragma once

namespace MindRun {

// Hook for a result that arrives after its caller stopped waiting.
template<typename T>
struct LateResult { using type = std::function<void(const T&)>; };

template<>
struct LateResult<void> { using type = std::function<void()>; };

template<typename T>
struct DeadlineState {
    std::mutex mutex;
    bool abandoned = false;
    std::promise<T> promise;
};

// Runs fn on a worker thread and waits at most `timeout` for it.
// On expiry TimeoutExceeded is thrown and the worker is left to finish
// on its own; the adapter call is never interrupted mid-flight. If it
// still succeeds, `on_late` receives the result on the worker thread.
// Anything fn captures must stay valid until it returns, so callers
// capture shared ownership rather than references.
template<typename T>
T call_with_deadline(const std::string& what, Millis timeout, std::function<T()> fn,
                     typename LateResult<T>::type on_late = {}){
    TRACE_FN("what=", what, " timeout_ms=", timeout.count());
    auto state = std::make_shared<DeadlineState<T>>();
    std::future<T> result = state->promise.get_future();

    std::thread([state, what, fn = std::move(fn), on_late = std::move(on_late)]() mutable {
        try{
            if constexpr (std::is_void_v<T>){
                fn();
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if(!state->abandoned){
                        state->promise.set_value();
                        return;
                    }
                }
                if(on_late) on_late();
            } else {
                T value = fn();
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if(!state->abandoned){
                        state->promise.set_value(std::move(value));
                        return;
                    }
                }
                if(on_late) on_late(value);
            }
        } catch(const std::exception& e){
            // The promise is still unset on every path that can throw.
            std::lock_guard<std::mutex> lock(state->mutex);
            if(state->abandoned) log_warning("Deadline", what + " failed after its deadline: " + e.what());
            state->promise.set_exception(std::current_exception());
        } catch(...){
            std::lock_guard<std::mutex> lock(state->mutex);
            state->promise.set_exception(std::current_exception());
        }
    }).detach();

    if(result.wait_for(timeout) != std::future_status::ready){
        std::lock_guard<std::mutex> lock(state->mutex);
        // The worker may have finished between the wait and the lock.
        if(result.wait_for(Millis(0)) != std::future_status::ready){
            state->abandoned = true;
            throw TimeoutExceeded(what + " exceeded " + std::to_string(timeout.count()) + "ms deadline");
        }
    }
    return result.get();
}

} // namespace MindRun
