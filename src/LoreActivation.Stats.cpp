#include "LoreComposer/LoreActivation.h"

namespace LoreComposer
{
	EntryStats GetEntryStats(const LoreBook* a_book) noexcept
	{
		EntryStats stats{};
		if (!a_book || a_book->entries.empty()) {
			return stats;
		}

		double prioritySum = 0.0;
		for (const auto& entry : a_book->entries) {
			++stats.total;
			if (entry.enabled) {
				++stats.enabled;
			} else {
				++stats.disabled;
			}
			if (entry.constant) {
				++stats.constant;
			}
			if (entry.position == LorePosition::kAfterChar) {
				++stats.afterChar;
			} else {
				++stats.beforeChar;
			}
			if (entry.selectiveLogic != SelectiveLogic::kNone) {
				++stats.selective;
			}
			if (entry.useRegex) {
				++stats.regex;
			}
			prioritySum += static_cast<double>(entry.priority);
		}

		stats.averagePriority = prioritySum / static_cast<double>(stats.total);
		return stats;
	}
}
