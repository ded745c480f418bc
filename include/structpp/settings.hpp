#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "common.hpp"
#include "log.hpp"
#include "utility.hpp"


namespace structpp {

    // Byte order of multi-byte scalars.
    enum class endian : unsigned char {
        little,
        big,
        native      // Whatever the host uses. Resolved to little or big at the point of use.
    };


    [[nodiscard]]
    constexpr std::string_view to_string(endian const order) noexcept {
        switch (order) {
        case endian::little:
            return "little";
        case endian::big:
            return "big";
        case endian::native:
            return "native";
        }
        return "unknown";
    }


    // Resolves endian::native to the host byte order. Other values are returned as-is.
    [[nodiscard]]
    constexpr endian concrete(endian const order) noexcept {
        if (order == endian::native) {
            return detail::is_little_endian ? endian::little : endian::big;
        }
        return order;
    }


    /*
        Settings:
            Each option is optional. An unset option defers to the next layer down. Layers are, highest precedence
            first: per-call overrides, struct-level settings, the active settings_context frame.
    */

    struct settings {
        std::optional<endian> byte_order;

        [[nodiscard]]
        friend bool operator==(settings const&, settings const&) noexcept = default;
    };


    // Overlays high onto low: every option set in high wins, everything else comes from low.
    [[nodiscard]]
    constexpr settings merge(settings const& high, settings const& low) noexcept {
        return settings{
            high.byte_order ? high.byte_order : low.byte_order
        };
    }


    // Merges the three settings layers by precedence. Never modifies any of them.
    [[nodiscard]]
    constexpr settings resolve(settings const& call, settings const& structure, settings const& context) noexcept {
        return merge(call, merge(structure, context));
    }


    // Per-thread stack of default settings.
    // The root frame is fixed to little endian and is never modified. Use push() and pop() (or preferably
    // scoped_settings) to change the defaults for a dynamic extent.
    class settings_context {
    public:
        settings_context() = delete;

        // The settings of the top frame.
        [[nodiscard]]
        static settings current() noexcept {
            return _stack().back();
        }

        // Number of frames, including the root.
        [[nodiscard]]
        static std::size_t depth() noexcept {
            return _stack().size();
        }

        // Pushes a copy of the top frame.
        static void push() {
            auto& stack = _stack();
            stack.push_back(stack.back());
            logger().trace("settings_context push, depth {}", stack.size());
        }

        // Discards the top frame. Throws empty_stack_error if only the root frame remains.
        static void pop() {
            auto& stack = _stack();
            if (stack.size() <= 1) {
                throw empty_stack_error{"Cannot pop the root settings frame"};
            }
            stack.pop_back();
            logger().trace("settings_context pop, depth {}", stack.size());
        }

        // Overlays the set options of overrides onto the top frame.
        // Throws empty_stack_error if only the root frame exists.
        static void update(settings const& overrides) {
            auto& stack = _stack();
            if (stack.size() <= 1) {
                throw empty_stack_error{"Cannot modify the root settings frame, push() a frame first"};
            }
            stack.back() = merge(overrides, stack.back());
        }

    private:
        [[nodiscard]]
        static std::vector<settings>& _stack() noexcept {
            thread_local std::vector<settings> stack{root};
            return stack;
        }

        // Drops frames until depth() == new_depth.
        static void _unwind(std::size_t const new_depth) noexcept {
            auto& stack = _stack();
            if (new_depth >= 1 && new_depth < stack.size()) {
                stack.resize(new_depth);
                logger().trace("settings_context unwind, depth {}", new_depth);
            }
        }

        static constexpr settings root{endian::little};

        friend class scoped_settings;
    };


    // Pushes a settings frame for the lifetime of the object, and discards it (and anything pushed on top of it)
    // on destruction, including during stack unwinding.
    class scoped_settings {
    public:
        explicit scoped_settings(settings const& overrides = {}) {
            settings_context::push();
            _depth = settings_context::depth();
            settings_context::update(overrides);
        }

        scoped_settings(scoped_settings const&) = delete;

        ~scoped_settings() {
            settings_context::_unwind(_depth - 1);
        }

        scoped_settings& operator=(scoped_settings const&) = delete;

    private:
        std::size_t _depth;
    };

}
