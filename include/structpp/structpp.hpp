#pragma once

#include <utility>

#include "common.hpp"
#include "formatter.hpp"
#include "instance.hpp"
#include "log.hpp"
#include "nested.hpp"
#include "scalar.hpp"
#include "settings.hpp"
#include "struct.hpp"
#include "typed_array.hpp"
#include "value.hpp"
#include "variable_array.hpp"


namespace structpp {

    // Serialises an entire struct instance.
    [[nodiscard]]
    inline bytes serialise(struct_instance const& instance, settings const& overrides = {}) {
        return instance.serialise(overrides);
    }


    // Deserialises an instance of a struct from the start of buffer.
    // A trailing variable-length field consumes the rest of the buffer. Otherwise bytes after the struct are ignored.
    [[nodiscard]]
    inline struct_instance deserialise(struct_definition_ptr definition, const_bytes_span const buffer,
            settings const& overrides = {}) {
        return struct_instance::deserialise(std::move(definition), buffer, overrides);
    }

}
