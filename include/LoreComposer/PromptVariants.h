#pragma once

#include "LoreComposer/FieldExtractor.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace LoreComposer
{
	enum class PromptVariant : std::uint8_t
	{
		kGenericV3,
		kStrictV3,
		kV2Compat,
	};

	namespace Variants
	{
		inline constexpr std::string_view kGenericV3Name = "generic-ccv3";
		inline constexpr std::string_view kStrictV3Name = "strict-ccv3";
		inline constexpr std::string_view kV2CompatName = "ccv2-compat";

		inline constexpr std::array<std::string_view, 7> kGenericV3Sections{
			Fields::kSystemPrompt,
			Fields::kDescription,
			Fields::kPersonality,
			Fields::kScenario,
			Fields::kMesExample,
			Fields::kFirstMes,
			Fields::kPostHistoryInstructions
		};

		inline constexpr std::array<std::string_view, 5> kStrictV3Sections{
			Fields::kDescription,
			Fields::kPersonality,
			Fields::kScenario,
			Fields::kMesExample,
			Fields::kFirstMes
		};

		inline constexpr std::array<std::string_view, 7> kV2CompatSections{
			Fields::kDescription,
			Fields::kPersonality,
			Fields::kScenario,
			Fields::kFirstMes,
			Fields::kMesExample,
			Fields::kSystemPrompt,
			Fields::kPostHistoryInstructions
		};
	}

	struct PromptVariantDefinition
	{
		PromptVariant variant{ PromptVariant::kGenericV3 };
		std::string_view name{};
		std::string_view label{};
		std::string_view description{};
		// Profile fields emitted by this variant, in assembly order.
		std::span<const std::string_view> sections{};
	};

	inline constexpr std::array<PromptVariantDefinition, 3> kAllVariants{
		PromptVariantDefinition{
			.variant = PromptVariant::kGenericV3,
			.name = Variants::kGenericV3Name,
			.label = "Generic CCv3",
			.description = "System prompt first, then the character sheet, greeting and post-history instructions.",
			.sections = Variants::kGenericV3Sections },
		PromptVariantDefinition{
			.variant = PromptVariant::kStrictV3,
			.name = Variants::kStrictV3Name,
			.label = "Strict CCv3",
			.description = "Character sheet and greeting only; system prompt and post-history instructions are left out.",
			.sections = Variants::kStrictV3Sections },
		PromptVariantDefinition{
			.variant = PromptVariant::kV2Compat,
			.name = Variants::kV2CompatName,
			.label = "CCv2 Compatible",
			.description = "Legacy v2 frontend ordering with the greeting before examples and the system prompt last.",
			.sections = Variants::kV2CompatSections }
	};

	[[nodiscard]] constexpr std::optional<PromptVariant> ParsePromptVariant(std::string_view a_name) noexcept
	{
		for (const auto& definition : kAllVariants) {
			if (definition.name == a_name) {
				return definition.variant;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr const PromptVariantDefinition& GetVariantDefinition(PromptVariant a_variant) noexcept
	{
		for (const auto& definition : kAllVariants) {
			if (definition.variant == a_variant) {
				return definition;
			}
		}
		return kAllVariants[0];
	}

	[[nodiscard]] constexpr std::optional<std::size_t> FindVariantSectionIndex(
		PromptVariant a_variant,
		std::string_view a_fieldName) noexcept
	{
		const auto sections = GetVariantDefinition(a_variant).sections;
		for (std::size_t i = 0; i < sections.size(); ++i) {
			if (sections[i] == a_fieldName) {
				return i;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::span<const PromptVariantDefinition> ListVariants() noexcept
	{
		return kAllVariants;
	}
}
