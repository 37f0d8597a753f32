#include "LoreComposer/PromptCompositor.h"

#include "PromptCompositor.Detail.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace LoreComposer
{
	OperationResult PreviewFieldChange(
		const CharacterProfile& a_profile,
		std::string_view a_fieldName,
		std::string a_newValue,
		std::string_view a_variant,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		FieldChangePreview& a_out)
	{
		PromptVariant variant{};
		if (auto result = CompositorDetail::ResolveVariant(a_variant, variant); !result.Ok()) {
			return result;
		}

		std::vector<NamedField> originalFields;
		if (auto result = NormalizeProfile(a_profile, originalFields); !result.Ok()) {
			return result;
		}

		CharacterProfile modifiedProfile;
		if (auto result = SetField(a_profile, a_fieldName, std::move(a_newValue), modifiedProfile); !result.Ok()) {
			return result;
		}

		std::vector<NamedField> modifiedFields;
		if (auto result = NormalizeProfile(modifiedProfile, modifiedFields); !result.Ok()) {
			return result;
		}

		FieldChangePreview preview{};
		const auto originalOutcome = CompositorDetail::RunProfileActivation(a_profile, originalFields, a_options);
		CompositorDetail::AssembleComposition(originalFields, variant, originalOutcome, a_budget, a_estimator, preview.original);

		// The greeting is the probe input unless the caller supplied one.
		const bool feedsScanWindow = !a_options.input.has_value() && a_fieldName == Fields::kFirstMes;
		if (feedsScanWindow) {
			const auto modifiedOutcome = CompositorDetail::RunProfileActivation(modifiedProfile, modifiedFields, a_options);
			CompositorDetail::AssembleComposition(modifiedFields, variant, modifiedOutcome, a_budget, a_estimator, preview.modified);
		} else {
			CompositorDetail::AssembleComposition(modifiedFields, variant, originalOutcome, a_budget, a_estimator, preview.modified);
			preview.activationReused = true;
		}

		preview.tokenDelta = static_cast<std::int64_t>(preview.modified.totalTokens) -
		                     static_cast<std::int64_t>(preview.original.totalTokens);
		spdlog::debug(
			"LoreComposer: preview of '{}' changes the prompt by {} tokens.",
			a_fieldName,
			preview.tokenDelta);

		a_out = std::move(preview);
		return {};
	}

	OperationResult CompareVariants(
		const CharacterProfile& a_profile,
		const std::vector<std::string>& a_variants,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		VariantComparison& a_out)
	{
		std::vector<PromptVariant> variants;
		if (a_variants.empty()) {
			for (const auto& definition : ListVariants()) {
				variants.push_back(definition.variant);
			}
		} else {
			for (const auto& name : a_variants) {
				PromptVariant variant{};
				if (auto result = CompositorDetail::ResolveVariant(name, variant); !result.Ok()) {
					return result;
				}
				variants.push_back(variant);
			}
		}

		std::vector<NamedField> fields;
		if (auto result = NormalizeProfile(a_profile, fields); !result.Ok()) {
			return result;
		}

		const auto outcome = CompositorDetail::RunProfileActivation(a_profile, fields, a_options);

		VariantComparison comparison{};
		comparison.compositions.reserve(variants.size());
		for (const auto variant : variants) {
			Composition composition{};
			CompositorDetail::AssembleComposition(fields, variant, outcome, a_budget, a_estimator, composition);
			comparison.compositions.push_back(std::move(composition));
		}

		a_out = std::move(comparison);
		return {};
	}
}
