#pragma once

#include "LoreComposer/LoreBook.h"

#include <cstdint>

namespace LoreComposer
{
	struct EntryOrderKey
	{
		std::int32_t priority{ 0 };
		std::int32_t insertionOrder{ 0 };
		std::int64_t id{ 0 };

		[[nodiscard]] constexpr bool operator==(const EntryOrderKey&) const noexcept = default;
	};

	[[nodiscard]] constexpr EntryOrderKey MakeEntryOrderKey(const LoreEntry& a_entry) noexcept
	{
		return EntryOrderKey{
			.priority = a_entry.priority,
			.insertionOrder = a_entry.insertionOrder,
			.id = a_entry.id
		};
	}

	// Activation order: priority descending, then insertion_order ascending, then id ascending.
	// Total over unique ids, so sorting with it is deterministic.
	[[nodiscard]] constexpr bool PrecedesInActivationOrder(const EntryOrderKey& a_lhs, const EntryOrderKey& a_rhs) noexcept
	{
		if (a_lhs.priority != a_rhs.priority) {
			return a_lhs.priority > a_rhs.priority;
		}
		if (a_lhs.insertionOrder != a_rhs.insertionOrder) {
			return a_lhs.insertionOrder < a_rhs.insertionOrder;
		}
		return a_lhs.id < a_rhs.id;
	}

	// Eviction order for lore under oldest-first: lowest priority first, then the earliest
	// inserted, then id.
	[[nodiscard]] constexpr bool PrecedesInEvictionOrder(const EntryOrderKey& a_lhs, const EntryOrderKey& a_rhs) noexcept
	{
		if (a_lhs.priority != a_rhs.priority) {
			return a_lhs.priority < a_rhs.priority;
		}
		if (a_lhs.insertionOrder != a_rhs.insertionOrder) {
			return a_lhs.insertionOrder < a_rhs.insertionOrder;
		}
		return a_lhs.id < a_rhs.id;
	}
}
