#pragma once

#include "LoreComposer/LoreActivation.h"
#include "LoreComposer/OperationResult.h"
#include "LoreComposer/ProfileValidation.h"
#include "LoreComposer/PromptCompositor.h"
#include "LoreComposer/PromptVariants.h"

#include <span>

#include <nlohmann/json_fwd.hpp>

namespace LoreComposer
{
	[[nodiscard]] nlohmann::json ToJson(const PromptSegment& a_segment);
	[[nodiscard]] nlohmann::json ToJson(const Composition& a_composition);
	[[nodiscard]] nlohmann::json ToJson(const ActivationResult& a_activation);
	[[nodiscard]] nlohmann::json ToJson(const TriggerTestResult& a_result);
	[[nodiscard]] nlohmann::json ToJson(const EntryStats& a_stats);
	[[nodiscard]] nlohmann::json ToJson(const FieldChangePreview& a_preview);
	[[nodiscard]] nlohmann::json ToJson(const VariantComparison& a_comparison);
	[[nodiscard]] nlohmann::json ToJson(const ValidationReport& a_report);
	[[nodiscard]] nlohmann::json ToJson(std::span<const PromptVariantDefinition> a_variants);
	[[nodiscard]] nlohmann::json ToJson(const OperationResult& a_result);
}
