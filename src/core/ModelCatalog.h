#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace vin {

struct ModelInfo {
    std::string_view name;
    std::string_view filename;          // multilingual weights
    std::string_view english_filename;  // empty if there is no English-only variant
    uint64_t approx_size{};             // bytes, per file
};

/*! The speech models the application knows how to fetch. */
class ModelCatalog {
public:
    static std::span<const ModelInfo> models() noexcept;

    static const ModelInfo *find(std::string_view name) noexcept;

    /*! Maps legacy and differently-cased names to a catalog name.
     *
     *  "tiny" and "base" are no longer offered and map to "small".
     */
    static std::string normalize(std::string_view name);
};

} // ns
