/*
MIT License

Copyright (c) 2026 dakingffo

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/
#if defined(_MSC_VER) && _MSC_VER > 1000 || defined(__clang__) || (defined(__GNUC__) && __GNUC__ >= 3)
#pragma once
#endif

#ifndef BEACON_HPP
#define BEACON_HPP

#ifndef BEACON_ALWAYS_INLINE
#   if defined(_MSC_VER)
#       define BEACON_ALWAYS_INLINE [[msvc::forceinline]]
#   else
#       define BEACON_ALWAYS_INLINE [[gnu::always_inline]]
#   endif
#endif // !BEACON_ALWAYS_INLINE

#define BEACON_VERSION_MAJOR 1
#define BEACON_VERSION_MINOR 0
#define BEACON_VERSION_PATCH 0

#include <stdexec/execution.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <any>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#define BEACON_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::beacon::logger(), __VA_ARGS__)
#define BEACON_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::beacon::logger(), __VA_ARGS__)
#define BEACON_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::beacon::logger(), __VA_ARGS__)

namespace beacon {
    struct signal_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Empty listener, missing receiver, or curried parameters that don't match.
    struct invalid_listener : signal_error {
        using signal_error::signal_error;
    };

    struct conflicting_once_state : signal_error {
        using signal_error::signal_error;
    };

    struct use_after_dispose : signal_error {
        using signal_error::signal_error;
    };

    namespace detail {
        inline std::shared_ptr<spdlog::logger>& logger_instance() {
            static std::shared_ptr<spdlog::logger> instance = [] {
                auto& sinks = spdlog::default_logger()->sinks();
                auto log = std::make_shared<spdlog::logger>("beacon", sinks.begin(), sinks.end());
                log->set_level(spdlog::level::warn);
                return log;
            }();
            return instance;
        }
    }

    /// Logger shared by every signal. Defaults to the spdlog default sinks at warn level.
    inline std::shared_ptr<spdlog::logger> logger() {
        return detail::logger_instance();
    }

    inline void set_logger(std::shared_ptr<spdlog::logger> log) {
        if (!log) {
            throw std::invalid_argument("Can't set logger: the logger is null.");
        }
        detail::logger_instance() = std::move(log);
    }

    namespace detail {
        template <typename Arg>
        concept signal_arg = std::copyable<Arg>;

        template <typename R>
        concept slot_result = std::same_as<R, void> || std::same_as<R, bool>;

        template <typename F, typename... Ts>
        concept invocable_slot = std::invocable<F&, Ts...> && slot_result<std::invoke_result_t<F&, Ts...>>;

        template <signal_arg... Args>
        class listener;

        template <signal_arg... Args>
        class binding;

        template <signal_arg... Args>
        class signal;

        template <signal_arg... Args>
        struct binding_state;

        template <typename Receiver, signal_arg... Args>
        struct dispatch_operation_state;

        template <typename Fn, typename... Params>
        struct curried_t {
            using function_type = Fn;
            using params_type   = std::tuple<Params...>;

            Fn                                   fn_;
            std::optional<std::tuple<Params...>> params_;
        };

        // Params given here are the defaults of every binding made from the listener.
        template <typename... Params>
        struct curry_t {
            template <typename Fn>
            curried_t<std::decay_t<Fn>, Params...> operator()(Fn&& fn) const {
                return {std::forward<Fn>(fn), std::nullopt};
            }

            template <typename Fn, typename... Values>
                requires (sizeof...(Params) > 0 && sizeof...(Values) == sizeof...(Params)
                    && std::constructible_from<std::tuple<Params...>, Values&&...>)
            curried_t<std::decay_t<Fn>, Params...> operator()(Fn&& fn, Values&&... values) const {
                return {std::forward<Fn>(fn), std::tuple<Params...>(std::forward<Values>(values)...)};
            }
        };

        template <typename T>
        struct member_traits {
            static constexpr bool value = false;
        };

        template <typename C, typename R, typename... A>
        struct member_traits<R (C::*)(A...)> {
            static constexpr bool value = true;
            using class_type    = C;
            using receiver_type = C*;
        };

        template <typename C, typename R, typename... A>
        struct member_traits<R (C::*)(A...) const> {
            static constexpr bool value = true;
            using class_type    = C;
            using receiver_type = const C*;
        };

        template <typename T>
        struct is_std_function : std::false_type {};

        template <typename R, typename... A>
        struct is_std_function<std::function<R(A...)>> : std::true_type {};

        template <typename T>
        struct is_bool_value : std::false_type {};

        template <>
        struct is_bool_value<std::tuple<bool>> : std::true_type {};

        template <typename F, typename... Args>
        struct curried_invocable : std::false_type {};

        template <typename Fn, typename... Params, typename... Args>
        struct curried_invocable<curried_t<Fn, Params...>, Args...>
            : std::bool_constant<invocable_slot<Fn, const Params&..., const Args&...>> {};

        template <typename F, typename... Args>
        concept member_slot = member_traits<F>::value
            && invocable_slot<F, typename member_traits<F>::class_type*, const Args&...>;

        template <typename F, typename... Args>
        concept curried_slot = curried_invocable<F, Args...>::value;

        template <typename F, typename... Args>
        concept sender_slot = std::copy_constructible<F>
            && std::derived_from<F, stdexec::sender_adaptor_closure<F>>;

        template <typename F, typename... Args>
        concept listener_callable = member_slot<F, Args...> || curried_slot<F, Args...> || sender_slot<F, Args...>
            || (std::copy_constructible<F> && invocable_slot<F, const Args&...>);

        template <signal_arg... Args>
        struct slot_base {
            slot_base()          = default;
            virtual ~slot_base() = default;

            virtual std::optional<bool> Invoke(const std::any& context, const std::any& params, const Args&... args) = 0;

            virtual const std::type_info& Context_type() const noexcept {
                return typeid(void);
            }

            virtual const std::type_info& Params_type() const noexcept {
                return typeid(std::tuple<>);
            }

        protected:
            template <typename Fn, typename... Ts>
            static std::optional<bool> Call(Fn& fn, Ts&&... values) {
                if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Ts...>>) {
                    std::invoke(fn, std::forward<Ts>(values)...);
                    return std::nullopt;
                }
                else {
                    return std::invoke(fn, std::forward<Ts>(values)...);
                }
            }
        };

        template <typename Fn, signal_arg... Args>
        struct slot_impl : slot_base<Args...> {
            template <typename F>
            slot_impl(F&& fn) : fn_(std::forward<F>(fn)) {}
            ~slot_impl() = default;

            std::optional<bool> Invoke(const std::any&, const std::any&, const Args&... args) override {
                return this->Call(fn_, args...);
            }

            Fn fn_;
        };

        template <typename Receiver, typename MemFn, signal_arg... Args>
        struct member_slot_impl : slot_base<Args...> {
            member_slot_impl(MemFn fn) : fn_(fn) {}
            ~member_slot_impl() = default;

            std::optional<bool> Invoke(const std::any& context, const std::any&, const Args&... args) override {
                auto receiver = std::any_cast<Receiver>(&context);
                if (!receiver || !*receiver) {
                    throw invalid_listener("Can't execute: the listener needs a receiver.");
                }
                return this->Call(fn_, *receiver, args...);
            }

            const std::type_info& Context_type() const noexcept override {
                return typeid(Receiver);
            }

            MemFn fn_;
        };

        template <typename Fn, typename ParamTuple, signal_arg... Args>
        struct curried_slot_impl;

        template <typename Fn, typename... Params, signal_arg... Args>
        struct curried_slot_impl<Fn, std::tuple<Params...>, Args...> : slot_base<Args...> {
            template <typename F>
            curried_slot_impl(F&& fn, std::optional<std::tuple<Params...>> defaults)
                : fn_(std::forward<F>(fn)), defaults_(std::move(defaults)) {}
            ~curried_slot_impl() = default;

            std::optional<bool> Invoke(const std::any&, const std::any& bound, const Args&... args) override {
                auto params = std::any_cast<std::tuple<Params...>>(&bound);
                if (!params && defaults_) {
                    params = &*defaults_;
                }
                if (!params) {
                    throw invalid_listener("Can't execute: the listener expects curried parameters that were never bound.");
                }
                return std::apply([&](const Params&... values) {
                    return this->Call(fn_, values..., args...);
                }, *params);
            }

            const std::type_info& Params_type() const noexcept override {
                return typeid(std::tuple<Params...>);
            }

            Fn                                   fn_;
            std::optional<std::tuple<Params...>> defaults_;
        };

        // Runs the closure inline; a stopped completion stops propagation like `false`.
        template <typename SenderClosure, signal_arg... Args>
        struct sender_slot_impl : slot_base<Args...> {
            template <typename C>
            sender_slot_impl(C&& closure) : closure_(std::forward<C>(closure)) {}
            ~sender_slot_impl() = default;

            std::optional<bool> Invoke(const std::any&, const std::any&, const Args&... args) override {
                auto result = stdexec::sync_wait(stdexec::just(args...) | closure_);
                if (!result) {
                    return false;
                }
                if constexpr (is_bool_value<std::decay_t<decltype(*result)>>::value) {
                    return std::get<0>(*result);
                }
                else {
                    return std::nullopt;
                }
            }

            SenderClosure closure_;
        };

        template <signal_arg... Args>
        class listener {
        public:
            listener() = default;

            template <typename Fn>
                requires (!std::same_as<std::remove_cvref_t<Fn>, listener> && listener_callable<std::decay_t<Fn>, Args...>)
            listener(Fn&& fn) : slot_(Make_slot(std::forward<Fn>(fn))) {}

            BEACON_ALWAYS_INLINE explicit operator bool() const noexcept {
                return static_cast<bool>(slot_);
            }

            friend bool operator==(const listener&, const listener&) noexcept = default;

        private:
            friend class binding<Args...>;
            friend class signal<Args...>;
            friend struct binding_state<Args...>;

            using slot = std::shared_ptr<slot_base<Args...>>;

            explicit listener(slot ptr) noexcept : slot_(std::move(ptr)) {}

            template <typename Fn>
            static slot Make_slot(Fn&& fn) {
                using F = std::decay_t<Fn>;
                if constexpr (member_slot<F, Args...>) {
                    if (fn == nullptr) {
                        return nullptr;
                    }
                    return std::make_shared<member_slot_impl<typename member_traits<F>::receiver_type, F, Args...>>(fn);
                }
                else if constexpr (curried_slot<F, Args...>) {
                    F curried = std::forward<Fn>(fn);
                    return std::make_shared<curried_slot_impl<typename F::function_type, typename F::params_type, Args...>>(
                        std::move(curried.fn_), std::move(curried.params_));
                }
                else if constexpr (sender_slot<F, Args...>) {
                    return std::make_shared<sender_slot_impl<F, Args...>>(std::forward<Fn>(fn));
                }
                else {
                    if constexpr (std::is_pointer_v<F> || is_std_function<F>::value) {
                        if (!fn) {
                            return nullptr;
                        }
                    }
                    return std::make_shared<slot_impl<F, Args...>>(std::forward<Fn>(fn));
                }
            }

            slot slot_;
        };

        template <signal_arg... Args>
        struct binding_state {
            using slot = std::shared_ptr<slot_base<Args...>>;

            binding_state(signal<Args...>* owner, slot listener_slot, bool is_once, std::any context, int priority)
                : slot_(std::move(listener_slot)), signal_(owner), context_(std::move(context)),
                  priority_(priority), is_once_(is_once) {}

            std::optional<bool> Execute(const Args&... args) {
                if (!active_ || !slot_) {
                    return std::nullopt;
                }
                // The listener may detach this binding while it runs.
                slot current = slot_;
                std::optional<bool> result = current->Invoke(context_, params_, args...);
                if (is_once_) {
                    Detach();
                }
                return result;
            }

            std::optional<listener<Args...>> Detach() {
                if (!Is_bound()) {
                    return std::nullopt;
                }
                return signal_->remove(listener<Args...>{slot_});
            }

            BEACON_ALWAYS_INLINE bool Is_bound() const noexcept {
                return signal_ != nullptr && slot_ != nullptr;
            }

            void Destroy() noexcept {
                signal_ = nullptr;
                slot_.reset();
                context_.reset();
            }

            slot             slot_;
            signal<Args...>* signal_;
            std::any         context_;
            std::any         params_;
            int              priority_;
            bool             is_once_;
            bool             active_ = true;
        };

        template <signal_arg... Args>
        class binding {
        public:
            using listener_type = listener<Args...>;

            binding() = default;

            std::optional<bool> execute(const Args&... args) const {
                auto state = ptr_.lock();
                if (!state) {
                    return std::nullopt;
                }
                return state->Execute(args...);
            }

            std::optional<listener_type> detach() const {
                auto state = ptr_.lock();
                if (!state) {
                    return std::nullopt;
                }
                return state->Detach();
            }

            BEACON_ALWAYS_INLINE bool is_bound() const noexcept {
                auto state = ptr_.lock();
                return state && state->Is_bound();
            }

            BEACON_ALWAYS_INLINE bool enable() const noexcept {
                auto state = ptr_.lock();
                if (!state) {
                    return false;
                }
                state->active_ = true;
                return true;
            }

            BEACON_ALWAYS_INLINE bool disable() const noexcept {
                auto state = ptr_.lock();
                if (!state) {
                    return false;
                }
                state->active_ = false;
                return true;
            }

            bool is_active() const noexcept {
                auto state = ptr_.lock();
                return state && state->active_;
            }

            bool is_once() const noexcept {
                auto state = ptr_.lock();
                return state && state->is_once_;
            }

            int priority() const noexcept {
                auto state = ptr_.lock();
                return state ? state->priority_ : 0;
            }

            std::optional<listener_type> get_listener() const {
                auto state = ptr_.lock();
                if (!state || !state->slot_) {
                    return std::nullopt;
                }
                return listener_type{state->slot_};
            }

            template <typename C>
            C* context() const noexcept {
                auto state = ptr_.lock();
                if (!state) {
                    return nullptr;
                }
                auto receiver = std::any_cast<C*>(&state->context_);
                return receiver ? *receiver : nullptr;
            }

            // Curried parameters are passed ahead of the dispatched arguments.
            template <typename... Params>
            bool params(Params&&... values) const {
                auto state = ptr_.lock();
                if (!state || !state->slot_) {
                    return false;
                }
                using tuple_type = std::tuple<std::decay_t<Params>...>;
                if (state->slot_->Params_type() != typeid(tuple_type)) {
                    throw invalid_listener("Can't bind params: the listener does not take parameters of these types.");
                }
                state->params_ = tuple_type{std::forward<Params>(values)...};
                return true;
            }

            friend bool operator==(const binding& lhs, const binding& rhs) noexcept {
                return !lhs.ptr_.owner_before(rhs.ptr_) && !rhs.ptr_.owner_before(lhs.ptr_);
            }

            friend std::ostream& operator<<(std::ostream& os, const binding& self) {
                return os << std::boolalpha << "[binding is_once:" << self.is_once()
                          << " is_bound:" << self.is_bound() << " active:" << self.is_active() << ']';
            }

        private:
            friend class signal<Args...>;

            explicit binding(std::weak_ptr<binding_state<Args...>> ptr) noexcept : ptr_(std::move(ptr)) {}

            std::weak_ptr<binding_state<Args...>> ptr_;
        };

        template <signal_arg... Args>
        class signal {
        public:
            using listener_type = listener<Args...>;
            using binding_type  = binding<Args...>;

            signal() : bindings_(std::make_shared<std::vector<slot>>()) {}

            virtual ~signal() {
                if (bindings_) {
                    for (auto& state : *bindings_) {
                        state->Destroy();
                    }
                }
            }

            signal(const signal&)            = delete;
            signal(signal&&)                 = delete;
            signal& operator=(const signal&) = delete;
            signal& operator=(signal&&)      = delete;

            binding_type add(const listener_type& l, int priority = 0) {
                return Register_listener(l, false, std::any{}, priority, "add");
            }

            template <typename C>
            binding_type add(const listener_type& l, C* context, int priority = 0) {
                return Register_listener(l, false, Make_context(l, context), priority, "add");
            }

            binding_type add_once(const listener_type& l, int priority = 0) {
                return Register_listener(l, true, std::any{}, priority, "add_once");
            }

            template <typename C>
            binding_type add_once(const listener_type& l, C* context, int priority = 0) {
                return Register_listener(l, true, Make_context(l, context), priority, "add_once");
            }

            listener_type remove(const listener_type& l) {
                Check_alive("remove");
                Validate(l, "remove");
                slot state = Find(l);
                if (state) {
                    state->Destroy();
                    Unregister(state);
                    BEACON_LOG_DEBUG("remove(): {} listener(s) left", bindings_->size());
                }
                return l;
            }

            void remove_all() {
                Check_alive("remove_all");
                for (auto& state : *bindings_) {
                    state->Destroy();
                }
                bindings_ = std::make_shared<std::vector<slot>>();
                BEACON_LOG_DEBUG("remove_all()");
            }

            bool has(const listener_type& l) const {
                Check_alive("has");
                Validate(l, "has");
                return Find(l) != nullptr;
            }

            std::size_t num_listeners() const {
                Check_alive("num_listeners");
                return bindings_->size();
            }

            // Stops the dispatch in progress after the current listener returns.
            void halt() {
                Check_alive("halt");
                should_propagate_ = false;
            }

            virtual void dispatch(const Args&... args) {
                Check_alive("dispatch");
                if (!active_) {
                    return;
                }

                std::shared_ptr<const std::vector<slot>> current_slots = bindings_;

                if (memorize_) {
                    last_params_.emplace(args...);
                }

                should_propagate_ = true;

                BEACON_LOG_TRACE("dispatch(): {} listener(s)", current_slots->size());

                // Higher priorities sit at the back; ties keep the earliest-added binding nearest the back.
                for (auto it = current_slots->rbegin(); it != current_slots->rend() && should_propagate_; ++it) {
                    if ((*it)->Execute(args...) == false) {
                        break;
                    }
                }
            }

            void forget() {
                Check_alive("forget");
                last_params_.reset();
            }

            virtual void dispose() {
                Check_alive("dispose");
                remove_all();
                bindings_.reset();
                last_params_.reset();
                disposed_ = true;
                BEACON_LOG_DEBUG("dispose()");
            }

            BEACON_ALWAYS_INLINE bool memorize() const noexcept {
                return memorize_;
            }

            void memorize(bool value) {
                Check_alive("memorize");
                memorize_ = value;
            }

            BEACON_ALWAYS_INLINE bool active() const noexcept {
                return active_;
            }

            void active(bool value) {
                Check_alive("active");
                active_ = value;
            }

            BEACON_ALWAYS_INLINE bool is_disposed() const noexcept {
                return disposed_;
            }

            friend std::ostream& operator<<(std::ostream& os, const signal& self) {
                return os << std::boolalpha << "[signal active:" << self.active_
                          << " num_listeners:" << self.Listener_count() << ']';
            }

        protected:
            BEACON_ALWAYS_INLINE void Check_alive(const char* fn) const {
                if (disposed_) [[unlikely]] {
                    throw use_after_dispose(std::string("Can't ") + fn + ": the signal has been disposed.");
                }
            }

            BEACON_ALWAYS_INLINE std::size_t Listener_count() const noexcept {
                return bindings_ ? bindings_->size() : 0;
            }

        private:
            template <typename, signal_arg...>
            friend struct dispatch_operation_state;

            using slot = std::shared_ptr<binding_state<Args...>>;

            // A const member function takes its receiver as a pointer to const.
            template <typename C>
            static std::any Make_context(const listener_type& l, C* context) {
                if (l.slot_ && l.slot_->Context_type() == typeid(const C*)) {
                    return std::any{static_cast<const C*>(context)};
                }
                return std::any{context};
            }

            static void Validate(const listener_type& l, const char* fn) {
                if (!l) {
                    throw invalid_listener(std::string("Can't ") + fn + ": the listener is empty.");
                }
            }

            binding_type Register_listener(const listener_type& l, bool is_once, std::any context, int priority, const char* fn) {
                Check_alive(fn);
                Validate(l, fn);

                slot state = Find(l);
                bool added = false;
                if (state) {
                    if (state->is_once_ != is_once) {
                        throw conflicting_once_state(is_once
                            ? "Can't add_once: the listener was already added with add(); remove it first."
                            : "Can't add: the listener was already added with add_once(); remove it first.");
                    }
                }
                else {
                    const std::type_info& receiver = l.slot_->Context_type();
                    if (receiver != typeid(void) && context.type() != receiver) {
                        throw invalid_listener(std::string("Can't ") + fn + ": the listener needs a receiver of its own class.");
                    }
                    state = std::make_shared<binding_state<Args...>>(this, l.slot_, is_once, std::move(context), priority);
                    Register(state);
                    added = true;
                    BEACON_LOG_DEBUG("{}(): priority {}, {} listener(s)", fn, priority, bindings_->size());
                }

                if (memorize_ && last_params_) {
                    auto params = *last_params_;
                    try {
                        std::apply([&state](const Args&... args) {
                            state->Execute(args...);
                        }, params);
                    }
                    catch (...) {
                        // A listener that fails its first replay is not left behind.
                        if (added && state->Is_bound()) {
                            state->Destroy();
                            Unregister(state);
                            BEACON_LOG_WARN("{}(): replay failed, listener rolled back", fn);
                        }
                        throw;
                    }
                }

                return binding_type{state};
            }

            slot Find(const listener_type& l) const {
                auto it = std::find_if(bindings_->begin(), bindings_->end(), [&l](const slot& state) {
                    return state->slot_ == l.slot_;
                });
                return it == bindings_->end() ? nullptr : *it;
            }

            void Register(const slot& new_slot) {
                auto new_slots = std::make_shared<std::vector<slot>>(*bindings_);
                auto pos = std::lower_bound(new_slots->begin(), new_slots->end(), new_slot->priority_,
                    [](const slot& state, int priority) {
                        return state->priority_ < priority;
                    });
                new_slots->insert(pos, new_slot);
                bindings_ = std::move(new_slots);
            }

            bool Unregister(const slot& ptr) {
                auto new_slots = std::make_shared<std::vector<slot>>(*bindings_);
                auto it = std::remove(new_slots->begin(), new_slots->end(), ptr);
                if (it == new_slots->end()) {
                    return false;
                }
                new_slots->erase(it, new_slots->end());
                bindings_ = std::move(new_slots);
                return true;
            }

            std::shared_ptr<const std::vector<slot>> bindings_;
            std::optional<std::tuple<Args...>>       last_params_;
            bool active_           = true;
            bool memorize_         = false;
            bool should_propagate_ = true;
            bool disposed_         = false;
        };

        template <signal_arg... Args>
        std::tuple<Args...> source_cast(signal<Args...>*);

        template <typename S, typename = void>
        struct source_degradation {
            using type = void;
        };

        template <typename S>
        struct source_degradation<S, std::void_t<decltype(source_cast(std::declval<S*>()))>> {
            using type = decltype(source_cast(std::declval<S*>()));
        };

        template <typename S>
        using source_args_t = typename source_degradation<S>::type;

        template <typename S>
        concept source_signal = (!std::same_as<source_args_t<S>, void>);

        template <source_signal... Sources>
        class compound_signal : public signal<source_args_t<Sources>...> {
            static_assert(sizeof...(Sources) > 0, "compound_signal should at least join one signal.");

        public:
            using base = signal<source_args_t<Sources>...>;

            explicit compound_signal(Sources&... sources) : sources_(std::addressof(sources)...) {
                this->memorize(true);
                try {
                    Attach(std::index_sequence_for<Sources...>{});
                }
                catch (...) {
                    Detach_sources();
                    throw;
                }
            }

            ~compound_signal() override {
                Detach_sources();
            }

            // A resolved unique compound replays what it collected and ignores `params`.
            void dispatch(const source_args_t<Sources>&... params) override {
                this->Check_alive("dispatch");
                if (resolved_ && unique_) {
                    auto collected = Collected();
                    std::apply([this](const auto&... values) {
                        this->base::dispatch(values...);
                    }, collected);
                }
                else {
                    params_ = params_type{params...};
                    resolved_ = true;
                    BEACON_LOG_DEBUG("compound_signal resolved: {} source(s), unique {}", sizeof...(Sources), unique_);
                    this->base::dispatch(params...);
                }

                if (this->is_disposed()) {
                    return;
                }
                if (unique_) {
                    this->remove_all();
                }
                else {
                    reset();
                }
            }

            void dispatch() {
                this->Check_alive("dispatch");
                if (!Registered_all()) {
                    BEACON_LOG_DEBUG("compound_signal::dispatch(): {} of {} source(s) collected, nothing to dispatch",
                        Collected_count(), sizeof...(Sources));
                    return;
                }
                Dispatch_collected();
            }

            void reset() {
                this->Check_alive("reset");
                params_ = params_type{};
                resolved_ = false;
            }

            BEACON_ALWAYS_INLINE bool is_resolved() const noexcept {
                return resolved_;
            }

            BEACON_ALWAYS_INLINE bool unique() const noexcept {
                return unique_;
            }

            void unique(bool value) {
                this->Check_alive("unique");
                unique_ = value;
            }

            BEACON_ALWAYS_INLINE bool overwrite() const noexcept {
                return overwrite_;
            }

            void overwrite(bool value) {
                this->Check_alive("overwrite");
                overwrite_ = value;
            }

            void dispose() override {
                base::dispose();
                Detach_sources();
                sources_ = std::tuple<Sources*...>{};
                params_ = params_type{};
                resolved_ = false;
            }

            friend std::ostream& operator<<(std::ostream& os, const compound_signal& self) {
                return os << std::boolalpha << "[compound_signal active:" << self.active()
                          << " num_listeners:" << self.Listener_count() << " resolved:" << self.resolved_ << ']';
            }

        private:
            using params_type   = std::tuple<std::optional<source_args_t<Sources>>...>;
            using bindings_type = std::tuple<typename Sources::binding_type...>;

            template <std::size_t... Is>
            void Attach(std::index_sequence<Is...>) {
                (Attach_source<Is>(), ...);
            }

            template <std::size_t I>
            void Attach_source() {
                std::get<I>(bindings_) = std::get<I>(sources_)->add([this](const auto&... args) {
                    this->template Register_dispatch<I>(args...);
                });
            }

            void Detach_sources() {
                std::apply([](auto&... handles) {
                    (static_cast<void>(handles.detach()), ...);
                }, bindings_);
            }

            // First firing wins the slot unless overwrite is set.
            template <std::size_t I, typename... A>
            void Register_dispatch(const A&... args) {
                auto& slot = std::get<I>(params_);
                if (!slot || overwrite_) {
                    slot.emplace(args...);
                }
                if (Registered_all() && (!resolved_ || !unique_)) {
                    Dispatch_collected();
                }
            }

            bool Registered_all() const noexcept {
                return std::apply([](const auto&... slots) {
                    return (slots.has_value() && ...);
                }, params_);
            }

            std::size_t Collected_count() const noexcept {
                return std::apply([](const auto&... slots) {
                    return (std::size_t{0} + ... + (slots.has_value() ? 1u : 0u));
                }, params_);
            }

            std::tuple<source_args_t<Sources>...> Collected() const {
                return std::apply([](const auto&... slots) {
                    return std::tuple<source_args_t<Sources>...>{*slots...};
                }, params_);
            }

            void Dispatch_collected() {
                auto collected = Collected();
                std::apply([this](const auto&... values) {
                    this->dispatch(values...);
                }, collected);
            }

            std::tuple<Sources*...> sources_;
            params_type             params_;
            bindings_type           bindings_;
            bool resolved_  = false;
            bool unique_    = true;
            bool overwrite_ = false;
        };

        template <typename Receiver, signal_arg... Args>
        struct dispatch_operation_state {
            template <typename Rcvr>
            dispatch_operation_state(signal<Args...>* sig, Rcvr&& rcvr)
                : signal_(sig), rcvr_(std::forward<Rcvr>(rcvr)) {}

            ~dispatch_operation_state() {
                static_cast<void>(binding_.detach());
            }

            dispatch_operation_state(const dispatch_operation_state&)            = delete;
            dispatch_operation_state(dispatch_operation_state&&)                 = delete;
            dispatch_operation_state& operator=(const dispatch_operation_state&) = delete;
            dispatch_operation_state& operator=(dispatch_operation_state&&)      = delete;

            friend void tag_invoke(stdexec::start_t, dispatch_operation_state& self) noexcept {
                try {
                    self.signal_->Check_alive("when_dispatched");
                    // Remembered params complete right away; nothing may touch `self` after set_value.
                    if (self.signal_->memorize_ && self.signal_->last_params_) {
                        auto params = *self.signal_->last_params_;
                        std::apply([&self](Args&... args) {
                            stdexec::set_value(std::move(self.rcvr_), std::move(args)...);
                        }, params);
                        return;
                    }
                    self.binding_ = self.signal_->add_once([&self](const Args&... args) {
                        stdexec::set_value(std::move(self.rcvr_), args...);
                    });
                }
                catch (...) {
                    stdexec::set_error(std::move(self.rcvr_), std::current_exception());
                }
            }

            signal<Args...>*  signal_;
            Receiver          rcvr_;
            binding<Args...>  binding_;
        };

        template <signal_arg... Args>
        struct dispatch_sender {
            using sender_concept = stdexec::sender_t;
            using completion_signatures = stdexec::completion_signatures<
                stdexec::set_value_t(Args...),
                stdexec::set_error_t(std::exception_ptr)
            >;

            template <stdexec::receiver Receiver>
            friend auto tag_invoke(stdexec::connect_t, dispatch_sender&& self, Receiver&& rcvr) {
                return dispatch_operation_state<std::decay_t<Receiver>, Args...>(self.signal_, std::forward<Receiver>(rcvr));
            }

            signal<Args...>* signal_;
        };

        struct when_dispatched_t {
            template <signal_arg... Args>
            BEACON_ALWAYS_INLINE dispatch_sender<Args...> operator()(signal<Args...>& sig) const noexcept {
                return {&sig};
            }
        };
    }

    using detail::signal;
    using detail::compound_signal;
    using detail::listener;
    using detail::binding;
    using detail::signal_arg;

    template <typename... Params>
    inline constexpr detail::curry_t<Params...> curry;

    inline constexpr detail::when_dispatched_t when_dispatched;
}

#endif // !BEACON_HPP
