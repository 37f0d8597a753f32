#include "LoreComposer/ResultJson.h"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace LoreComposer
{
	nlohmann::json ToJson(const PromptSegment& a_segment)
	{
		nlohmann::json out{
			{ "fieldName", a_segment.fieldName },
			{ "text", a_segment.text },
			{ "tokens", a_segment.tokens },
			{ "source", std::string(SegmentSourceName(a_segment.source)) },
			{ "priority", a_segment.priority },
			{ "order", a_segment.order }
		};
		if (a_segment.truncated) {
			out["truncated"] = true;
			out["originalTokens"] = a_segment.originalTokens;
		}
		return out;
	}

	nlohmann::json ToJson(const Composition& a_composition)
	{
		auto segments = nlohmann::json::array();
		for (const auto& segment : a_composition.segments) {
			segments.push_back(ToJson(segment));
		}

		auto dropped = nlohmann::json::array();
		for (const auto& segment : a_composition.droppedSegments) {
			nlohmann::json entry{
				{ "fieldName", segment.fieldName },
				{ "tokens", segment.tokens },
				{ "source", std::string(SegmentSourceName(segment.source)) }
			};
			if (segment.truncated) {
				entry["truncated"] = true;
			}
			dropped.push_back(std::move(entry));
		}

		return nlohmann::json{
			{ "variant", a_composition.variant },
			{ "segments", std::move(segments) },
			{ "droppedSegments", std::move(dropped) },
			{ "totalTokens", a_composition.totalTokens },
			{ "overBudget", a_composition.overBudget },
			{ "fullPrompt", a_composition.fullPrompt }
		};
	}

	nlohmann::json ToJson(const ActivationResult& a_activation)
	{
		const auto& entry = *a_activation.entry;
		return nlohmann::json{
			{ "id", entry.id },
			{ "name", entry.name },
			{ "content", entry.content },
			{ "priority", entry.priority },
			{ "position", std::string(LorePositionName(entry.position)) },
			{ "matchedKeys", a_activation.matchedKeys },
			{ "matchedSecondaryKeys", a_activation.matchedSecondaryKeys },
			{ "reason", std::string(ActivationReasonName(a_activation.reason)) },
			{ "pass", a_activation.pass }
		};
	}

	nlohmann::json ToJson(const TriggerTestResult& a_result)
	{
		auto active = nlohmann::json::array();
		for (const auto& activation : a_result.outcome.activations) {
			active.push_back(ToJson(activation));
		}

		return nlohmann::json{
			{ "activeEntries", std::move(active) },
			{ "passes", a_result.outcome.passes },
			{ "injectionPreview", a_result.injectionPreview },
			{ "totalTokens", a_result.totalTokens }
		};
	}

	nlohmann::json ToJson(const EntryStats& a_stats)
	{
		return nlohmann::json{
			{ "total", a_stats.total },
			{ "enabled", a_stats.enabled },
			{ "disabled", a_stats.disabled },
			{ "constant", a_stats.constant },
			{ "beforeChar", a_stats.beforeChar },
			{ "afterChar", a_stats.afterChar },
			{ "selective", a_stats.selective },
			{ "regex", a_stats.regex },
			{ "averagePriority", a_stats.averagePriority }
		};
	}

	nlohmann::json ToJson(const FieldChangePreview& a_preview)
	{
		return nlohmann::json{
			{ "original", ToJson(a_preview.original) },
			{ "modified", ToJson(a_preview.modified) },
			{ "tokenDelta", a_preview.tokenDelta },
			{ "activationReused", a_preview.activationReused }
		};
	}

	nlohmann::json ToJson(const VariantComparison& a_comparison)
	{
		auto out = nlohmann::json::array();
		for (const auto& composition : a_comparison.compositions) {
			out.push_back(ToJson(composition));
		}
		return out;
	}

	nlohmann::json ToJson(const ValidationReport& a_report)
	{
		auto issues = nlohmann::json::array();
		for (const auto& issue : a_report.issues) {
			issues.push_back(nlohmann::json{
				{ "field", issue.field },
				{ "message", issue.message },
				{ "severity", std::string(IssueSeverityName(issue.severity)) } });
		}
		return nlohmann::json{
			{ "valid", a_report.valid },
			{ "issues", std::move(issues) }
		};
	}

	nlohmann::json ToJson(std::span<const PromptVariantDefinition> a_variants)
	{
		auto out = nlohmann::json::array();
		for (const auto& definition : a_variants) {
			auto sections = nlohmann::json::array();
			for (const auto section : definition.sections) {
				sections.push_back(std::string(section));
			}
			out.push_back(nlohmann::json{
				{ "name", std::string(definition.name) },
				{ "label", std::string(definition.label) },
				{ "description", std::string(definition.description) },
				{ "sections", std::move(sections) } });
		}
		return out;
	}

	nlohmann::json ToJson(const OperationResult& a_result)
	{
		return nlohmann::json{
			{ "status", std::string(StatusName(a_result.status)) },
			{ "message", a_result.message }
		};
	}
}
