#pragma once

#include <nadeef/pipeline/context.hpp>
#include <nadeef/pipeline/stage.hpp>

#include <cstdint>
#include <memory>
#include <variant>

namespace nadeef::pipeline {

using ContextPtr = std::shared_ptr<const CleanContext>;

/// Key -> Tables: looks up the rule and opens one RelationalTable per source.
class SourceDeserializer final : public Stage {
   public:
    explicit SourceDeserializer(ContextPtr context);

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
};

/// Tables -> Blocks: applies the rule's scope, blocks single-source input
/// on the rule's block columns and materializes the blocks concurrently.
class QueryEngine final : public Stage {
   public:
    explicit QueryEngine(ContextPtr context);

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
};

/// Calls Rule::detect(Table&) once per block.
struct TableDetection {
    [[nodiscard]] auto run(const Rule& rule, const std::vector<TablePtr>& tables) const
        -> std::vector<Violation>;
};

/// Calls Rule::detect(Row, Row) over every pair: the cross product of two
/// sources, or each unordered pair within a block of one source.
struct PairDetection {
    [[nodiscard]] auto run(const Rule& rule, const std::vector<TablePtr>& tables) const
        -> std::vector<Violation>;
};

using Detection = std::variant<TableDetection, PairDetection>;

enum class DetectorShape : std::uint8_t {
    Single,
    Pair,
};

/// Blocks -> Violations. The detection shape is fixed at construction.
class ViolationDetector final : public Stage {
   public:
    ViolationDetector(ContextPtr context, Detection detection);

    /// Detector whose shape matches the rule's declared arity.
    [[nodiscard]] static auto for_rule(ContextPtr context, const Rule& rule)
        -> std::unique_ptr<ViolationDetector>;

    [[nodiscard]] auto shape() const noexcept -> DetectorShape {
        return std::holds_alternative<PairDetection>(detection_) ? DetectorShape::Pair
                                                                 : DetectorShape::Single;
    }

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
    Detection detection_;
};

/// Violations -> Summary: appends the violations to the violation table.
class ViolationExport final : public Stage {
   public:
    explicit ViolationExport(ContextPtr context);

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
};

/// Key -> Violations: reads back the violations recorded for the rule.
class ViolationDeserializer final : public Stage {
   public:
    explicit ViolationDeserializer(ContextPtr context);

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
};

/// Violations -> Summary: asks the rule for fixes and writes them to the store.
class ViolationRepair final : public Stage {
   public:
    explicit ViolationRepair(ContextPtr context);

   protected:
    auto execute(StageData data) -> std::expected<StageData, std::string> override;

   private:
    ContextPtr context_;
};

/// DDL of the violation table.
[[nodiscard]] auto violation_table_ddl(const std::string& table) -> std::string;

}  // namespace nadeef::pipeline
