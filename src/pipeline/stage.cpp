#include <nadeef/pipeline/stage.hpp>

#include <fmt/format.h>

namespace nadeef::pipeline {

auto to_string(DataKind kind) -> std::string_view {
    switch (kind) {
        case DataKind::Key:
            return "key";
        case DataKind::Tables:
            return "tables";
        case DataKind::Blocks:
            return "blocks";
        case DataKind::Violations:
            return "violations";
        case DataKind::Summary:
            return "summary";
    }
    return "unknown";
}

auto Stage::run(StageData data) -> std::expected<StageData, std::string> {
    if (kind_of(data) != input_) {
        return std::unexpected(fmt::format("stage {} expects {} but received {}", name_,
                                           to_string(input_), to_string(kind_of(data))));
    }
    auto result = execute(std::move(data));
    if (result && kind_of(*result) != output_) {
        return std::unexpected(fmt::format("stage {} produced {} instead of {}", name_,
                                           to_string(kind_of(*result)), to_string(output_)));
    }
    return result;
}

}  // namespace nadeef::pipeline
