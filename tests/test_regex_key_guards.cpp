#include "LoreComposer/RegexKey.h"

using LoreComposer::PrecheckRegexPattern;
using LoreComposer::RegexKeyError;
using LoreComposer::RegexLimits;
using LoreComposer::SplitRegexKey;
using LoreComposer::detail::HasNestedQuantifier;
using LoreComposer::detail::HasRegexBackreference;
using LoreComposer::detail::HasRepeatedAlternation;

static_assert(SplitRegexKey("/drag(on|oon)/i").pattern == "drag(on|oon)");
static_assert(SplitRegexKey("/drag(on|oon)/i").forceIgnoreCase);
static_assert(SplitRegexKey("/dragon/").pattern == "dragon");
static_assert(!SplitRegexKey("/dragon/").forceIgnoreCase);
static_assert(SplitRegexKey("dragon").pattern == "dragon");
static_assert(SplitRegexKey("a/b").pattern == "a/b");

static_assert(HasRegexBackreference("(a)\\1"));
static_assert(HasRegexBackreference("(?<x>a)\\k<x>"));
static_assert(!HasRegexBackreference("\\d+\\s"));
static_assert(!HasRegexBackreference("[\\1]"));

static_assert(HasNestedQuantifier("(a+)+"));
static_assert(HasNestedQuantifier("(a*)*b"));
static_assert(HasNestedQuantifier("(\\w+\\s?)*$"));
static_assert(HasNestedQuantifier("((ab)+){2,}"));
static_assert(!HasNestedQuantifier("(ab)+"));
static_assert(!HasNestedQuantifier("(a+)b"));
static_assert(!HasNestedQuantifier("(a+){3}"));
static_assert(!HasNestedQuantifier("[(+)]+"));
static_assert(!HasNestedQuantifier("\\(a+\\)+"));

static_assert(PrecheckRegexPattern("", RegexLimits{}) == RegexKeyError::kEmpty);
static_assert(PrecheckRegexPattern("dragon|wyrm", RegexLimits{}) == RegexKeyError::kNone);
static_assert(PrecheckRegexPattern("(x+)+y", RegexLimits{}) == RegexKeyError::kNestedQuantifier);
static_assert(PrecheckRegexPattern("(x)\\1", RegexLimits{}) == RegexKeyError::kBackreference);
static_assert(PrecheckRegexPattern("abcdef", RegexLimits{ .maxPatternLength = 4 }) == RegexKeyError::kTooLong);

static_assert(HasRepeatedAlternation("(x|y)*z"));
static_assert(HasRepeatedAlternation("(a|aa)+b"));
static_assert(HasRepeatedAlternation("(?:cat|dog){2,}"));
static_assert(HasRepeatedAlternation("((a|b)c){3}"));
static_assert(!HasRepeatedAlternation("drag(on|oon)s?"));
static_assert(!HasRepeatedAlternation("(on|oon)?"));
static_assert(!HasRepeatedAlternation("dragon|wyrm"));
static_assert(!HasRepeatedAlternation("[x|y]+"));
static_assert(!HasRepeatedAlternation("(x\\|y)+"));
static_assert(PrecheckRegexPattern("(x|y)*z", RegexLimits{}) == RegexKeyError::kRepeatedAlternation);
static_assert(RegexLimits{}.maxWindowBytes <= 4 * 1024);
