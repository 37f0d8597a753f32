#include "LoreComposer/PromptCompositor.h"

#include "PromptCompositor.Detail.h"

#include "LoreComposer/TokenEstimator.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace LoreComposer
{
	namespace
	{
		const NamedField* FindField(const std::vector<NamedField>& a_fields, std::string_view a_name) noexcept
		{
			for (const auto& field : a_fields) {
				if (field.name == a_name) {
					return &field;
				}
			}
			return nullptr;
		}

		PromptSegment MakeLoreSegment(const ActivationResult& a_activation, const TokenEstimator& a_estimator)
		{
			const auto& entry = *a_activation.entry;
			PromptSegment segment{
				.fieldName = MakeLoreSegmentName(entry),
				.text = entry.content,
				.source = entry.position == LorePosition::kAfterChar ? SegmentSource::kLoreAfter : SegmentSource::kLoreBefore,
				.priority = entry.priority,
				.definitionOrder = a_activation.entryIndex,
				.loreOrder = MakeEntryOrderKey(entry)
			};
			segment.tokens = a_estimator.Estimate(segment.text);
			segment.originalTokens = segment.tokens;
			return segment;
		}
	}

	namespace CompositorDetail
	{
		OperationResult ResolveVariant(std::string_view a_name, PromptVariant& a_out)
		{
			const auto variant = ParsePromptVariant(a_name);
			if (!variant) {
				return MakeFailure(Status::kUnknownVariant, "unknown prompt variant '" + std::string(a_name) + "'");
			}
			a_out = *variant;
			return {};
		}

		std::string ResolveProbeInput(
			const std::vector<NamedField>& a_fields,
			const ComposeOptions& a_options)
		{
			if (a_options.input.has_value()) {
				return *a_options.input;
			}
			const auto* greeting = FindField(a_fields, Fields::kFirstMes);
			return greeting ? greeting->text : std::string{};
		}

		ActivationOutcome RunProfileActivation(
			const CharacterProfile& a_profile,
			const std::vector<NamedField>& a_fields,
			const ComposeOptions& a_options)
		{
			const auto* book = GetLoreBook(a_profile);
			if (!book) {
				return {};
			}
			return ActivateEntries(*book, ResolveProbeInput(a_fields, a_options), a_options.history, a_options.activation);
		}

		void AssembleComposition(
			const std::vector<NamedField>& a_fields,
			PromptVariant a_variant,
			const ActivationOutcome& a_outcome,
			const std::optional<TokenBudget>& a_budget,
			const TokenEstimator& a_estimator,
			Composition& a_out)
		{
			const auto& definition = GetVariantDefinition(a_variant);

			Composition composition{};
			composition.variant = std::string(definition.name);

			for (const auto& activation : a_outcome.activations) {
				if (activation.entry->position == LorePosition::kBeforeChar) {
					composition.segments.push_back(MakeLoreSegment(activation, a_estimator));
				}
			}

			for (std::size_t i = 0; i < definition.sections.size(); ++i) {
				const auto name = definition.sections[i];
				const auto* field = FindField(a_fields, name);
				PromptSegment segment{
					.fieldName = std::string(name),
					.text = field ? field->text : std::string{},
					.source = SegmentSource::kProfileField,
					.priority = ResolveImplicitFieldPriority(i),
					.definitionOrder = static_cast<std::uint32_t>(FindCanonicalFieldIndex(name).value_or(i))
				};
				segment.tokens = a_estimator.Estimate(segment.text);
				segment.originalTokens = segment.tokens;
				composition.segments.push_back(std::move(segment));
			}

			for (const auto& activation : a_outcome.activations) {
				if (activation.entry->position == LorePosition::kAfterChar) {
					composition.segments.push_back(MakeLoreSegment(activation, a_estimator));
				}
			}

			for (std::size_t i = 0; i < composition.segments.size(); ++i) {
				auto& segment = composition.segments[i];
				segment.order = static_cast<std::uint32_t>(i);
				composition.totalTokens += segment.tokens;
			}

			if (a_budget.has_value()) {
				ApplyTokenBudget(composition, *a_budget, a_estimator);
			}

			composition.fullPrompt = JoinPromptSegments(composition.segments);
			spdlog::debug(
				"LoreComposer: composed '{}' with {} segments, {} tokens ({} dropped).",
				composition.variant,
				composition.segments.size(),
				composition.totalTokens,
				composition.droppedSegments.size());

			a_out = std::move(composition);
		}
	}

	OperationResult ComposePrompt(
		const CharacterProfile& a_profile,
		std::string_view a_variant,
		const std::optional<TokenBudget>& a_budget,
		const ComposeOptions& a_options,
		const TokenEstimator& a_estimator,
		Composition& a_out)
	{
		PromptVariant variant{};
		if (auto result = CompositorDetail::ResolveVariant(a_variant, variant); !result.Ok()) {
			return result;
		}

		std::vector<NamedField> fields;
		if (auto result = NormalizeProfile(a_profile, fields); !result.Ok()) {
			return result;
		}

		const auto outcome = CompositorDetail::RunProfileActivation(a_profile, fields, a_options);
		CompositorDetail::AssembleComposition(fields, variant, outcome, a_budget, a_estimator, a_out);
		return {};
	}

	std::string JoinPromptSegments(const std::vector<PromptSegment>& a_segments)
	{
		std::string out;
		for (const auto& segment : a_segments) {
			if (segment.text.empty()) {
				continue;
			}
			if (!out.empty()) {
				out.append("\n\n");
			}
			out.append(segment.text);
		}
		return out;
	}
}
