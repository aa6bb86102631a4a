#include <rcell/runtime/effect.h>
#include <rcell/runtime/running.h>
#include <rcell/util/debug_flags.h>
#include <rcell/util/errors.h>

namespace rcell {

    namespace {
        /**
         * One run of an effect. The running state is resolved for the whole run, so disposing the effect from
         * inside its own body cannot release it underneath us.
         */
        void run_effect(const running_w_ptr &weak_running, const std::function<void()> &effect) {
            auto running = weak_running.lock();
            if (!running) { fatal_invariant_violation("effect body invoked after its computation was released"); }

            // Release what the previous run created, then start with no dependencies.
            running->scope.dispose();
            running->clear_dependencies();

            auto scope = [&] {
                auto guard = DependencyTracker::instance().enter(weak_running);
                return create_root(effect);
            }();

            if (running->is_disposed()) {
                // Disposed by something this run triggered, nothing it created may outlive it.
                scope.dispose();
                return;
            }
            running->subscribe_dependencies();
            running->scope = std::move(scope);
        }
    } // namespace

    void create_effect(std::function<void()> effect) {
        auto running = std::make_shared<Running>();
        running->execute = CallbackBody::make(
            [weak_running = running_w_ptr{running}, effect = std::move(effect)] { run_effect(weak_running, effect); });

        // The first run cannot be re-entrant or disposed, the body has not been published anywhere yet.
        static_cast<void>(running->execute->try_invoke());

        auto &tracker = DependencyTracker::instance();
        if (auto *scope = tracker.current_scope(); scope != nullptr) {
            scope->add_effect(std::move(running));
        } else {
            warn("effect created outside of a reactive scope, it will only be disposed at thread exit");
            tracker.adopt_detached(std::move(running));
        }
    }

} // namespace rcell
