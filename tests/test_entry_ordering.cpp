#include "LoreComposer/EntryOrdering.h"

#include <algorithm>
#include <array>

using LoreComposer::EntryOrderKey;
using LoreComposer::PrecedesInActivationOrder;
using LoreComposer::PrecedesInEvictionOrder;

static_assert(PrecedesInActivationOrder(
	EntryOrderKey{ .priority = 10, .insertionOrder = 9, .id = 9 },
	EntryOrderKey{ .priority = 5, .insertionOrder = 0, .id = 0 }));

static_assert(PrecedesInActivationOrder(
	EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 9 },
	EntryOrderKey{ .priority = 5, .insertionOrder = 2, .id = 0 }));

static_assert(PrecedesInActivationOrder(
	EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 3 },
	EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 4 }));

static_assert(!PrecedesInActivationOrder(
	EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 3 },
	EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 3 }));

static_assert(PrecedesInEvictionOrder(
	EntryOrderKey{ .priority = 1, .insertionOrder = 50, .id = 50 },
	EntryOrderKey{ .priority = 2, .insertionOrder = 0, .id = 0 }));

static_assert([] {
	std::array<EntryOrderKey, 4> keys{
		EntryOrderKey{ .priority = 5, .insertionOrder = 2, .id = 1 },
		EntryOrderKey{ .priority = 10, .insertionOrder = 7, .id = 2 },
		EntryOrderKey{ .priority = 5, .insertionOrder = 1, .id = 3 },
		EntryOrderKey{ .priority = 10, .insertionOrder = 7, .id = 0 }
	};
	std::sort(keys.begin(), keys.end(), PrecedesInActivationOrder);
	return keys[0].id == 0 && keys[1].id == 2 && keys[2].id == 3 && keys[3].id == 1;
}());
