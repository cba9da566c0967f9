// =============================================================================
// event_type_registry_test.cpp
// =============================================================================
// Unit tests for evcore::EventTypeRegistry.
//
// Validates:
//   - Built-in Timer type is pre-registered
//   - User ids start at 1000, are unique and monotonic
//   - Name lookup (first registration wins) and unknown-id naming
//   - Exhaustion of the user range throws EventTypesExhausted
// =============================================================================

#include "evcore/errors/dispatch_error.hpp"
#include "evcore/events/event_type_registry.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

// -----------------------------------------------------------------------------
// 1. The Timer kind exists before any user registration.
// -----------------------------------------------------------------------------
TEST(EventTypeRegistryTest, BuiltinTimerIsRegistered) {
  evcore::EventTypeRegistry types;
  const auto timer = evcore::toTypeId(evcore::BuiltinEventType::Timer);

  EXPECT_TRUE(types.isRegistered(timer));
  EXPECT_EQ(types.nameOf(timer), "Timer");
  EXPECT_FALSE(types.isRegistered(0));
  EXPECT_EQ(types.userTypeCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. User ids begin at 1000 and never collide.
// -----------------------------------------------------------------------------
TEST(EventTypeRegistryTest, UserIdsAreUniqueFromFirstUserType) {
  evcore::EventTypeRegistry types;
  std::set<evcore::TypeId> seen;

  const auto first = types.registerEventType("A");
  EXPECT_EQ(first, evcore::EventTypeRegistry::kFirstUserType);
  seen.insert(first);

  for (int i = 0; i < 50; ++i) {
    auto id = types.registerEventType("T" + std::to_string(i));
    EXPECT_TRUE(seen.insert(id).second);
    EXPECT_GT(id, first);
  }
  EXPECT_EQ(types.userTypeCount(), 51u);
}

// -----------------------------------------------------------------------------
// 3. findByName() resolves to the first registration of a name.
// -----------------------------------------------------------------------------
TEST(EventTypeRegistryTest, FindByNameReturnsFirstRegistration) {
  evcore::EventTypeRegistry types;
  const auto original = types.registerEventType("Greeting");
  const auto duplicate = types.registerEventType("Greeting");

  EXPECT_NE(original, duplicate);
  EXPECT_EQ(types.findByName("Greeting"), original);
  EXPECT_EQ(types.nameOf(duplicate), "Greeting");
  EXPECT_FALSE(types.findByName("Missing").has_value());
}

// -----------------------------------------------------------------------------
// 4. nameOf() on an unknown id gives a diagnostic name instead of throwing.
// -----------------------------------------------------------------------------
TEST(EventTypeRegistryTest, NameOfUnknownIdIsDiagnostic) {
  evcore::EventTypeRegistry types;
  EXPECT_EQ(types.nameOf(4242), "<unregistered:4242>");
}

// -----------------------------------------------------------------------------
// 5. Registering past kMaxUserType throws EventTypesExhausted.
// -----------------------------------------------------------------------------
TEST(EventTypeRegistryTest, ExhaustionThrows) {
  evcore::EventTypeRegistry types;
  const evcore::TypeId capacity = evcore::EventTypeRegistry::kMaxUserType -
                                  evcore::EventTypeRegistry::kFirstUserType + 1;
  evcore::TypeId last = 0;
  for (evcore::TypeId i = 0; i < capacity; ++i) {
    last = types.registerEventType("T");
  }
  EXPECT_EQ(last, evcore::EventTypeRegistry::kMaxUserType);

  try {
    types.registerEventType("OneTooMany");
    FAIL() << "expected DispatchError";
  } catch (const evcore::DispatchError& e) {
    EXPECT_EQ(e.kind(), evcore::ErrorKind::EventTypesExhausted);
  }
  EXPECT_FALSE(types.findByName("OneTooMany").has_value());
}
