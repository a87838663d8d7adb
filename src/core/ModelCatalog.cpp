
#include <array>
#include <algorithm>
#include <cctype>

#include "ModelCatalog.h"

using namespace std;

namespace vin {

namespace {

constexpr auto catalog = to_array<ModelInfo>({
    {"small", "ggml-small.bin", "ggml-small.en.bin", 487'601'967},
    {"medium", "ggml-medium.bin", "ggml-medium.en.bin", 1'533'763'059},
    {"large", "ggml-large-v2.bin", "", 3'094'623'691},
});

} // anon ns

std::span<const ModelInfo> ModelCatalog::models() noexcept
{
    return catalog;
}

const ModelInfo *ModelCatalog::find(std::string_view name) noexcept
{
    const auto it = ranges::find(catalog, name, &ModelInfo::name);
    return it == catalog.end() ? nullptr : &*it;
}

std::string ModelCatalog::normalize(std::string_view name)
{
    string n;
    for (const auto ch : name) {
        if (!isspace(static_cast<unsigned char>(ch))) {
            n.push_back(static_cast<char>(tolower(static_cast<unsigned char>(ch))));
        }
    }

    if (n.empty() || n == "tiny" || n == "base") {
        return "small";
    }

    return n;
}

} // ns
