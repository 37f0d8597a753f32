#pragma once

#include "LoreComposer/FieldExtractor.h"
#include "LoreComposer/PromptCompositor.h"
#include "LoreComposer/PromptVariants.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LoreComposer::CompositorDetail
{
	[[nodiscard]] OperationResult ResolveVariant(std::string_view a_name, PromptVariant& a_out);

	// Explicit input when given, otherwise the normalized greeting.
	[[nodiscard]] std::string ResolveProbeInput(
		const std::vector<NamedField>& a_fields,
		const ComposeOptions& a_options);

	// Empty outcome when the profile carries no lorebook.
	[[nodiscard]] ActivationOutcome RunProfileActivation(
		const CharacterProfile& a_profile,
		const std::vector<NamedField>& a_fields,
		const ComposeOptions& a_options);

	// Entry pointers in a_outcome are only read while assembling; the composition owns copies.
	void AssembleComposition(
		const std::vector<NamedField>& a_fields,
		PromptVariant a_variant,
		const ActivationOutcome& a_outcome,
		const std::optional<TokenBudget>& a_budget,
		const TokenEstimator& a_estimator,
		Composition& a_out);
}
