#include <gtest/gtest.h>
#include <optional>

#include "domain/name_registry.hpp"

namespace ingest_service {
namespace {

TEST(NameRegistryTest, NameIsHeldUntilReservationDies) {
  NameRegistry registry;
  {
    auto first = registry.reserve("clip.mp4");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(static_cast<bool>(*first));
    EXPECT_EQ(first->name(), "clip.mp4");
    EXPECT_TRUE(registry.contains("clip.mp4"));
    EXPECT_FALSE(registry.reserve("clip.mp4").has_value());
  }
  EXPECT_FALSE(registry.contains("clip.mp4"));
  EXPECT_TRUE(registry.reserve("clip.mp4").has_value());
}

TEST(NameRegistryTest, MovedReservationKeepsTheName) {
  NameRegistry registry;
  NameReservation holder;
  EXPECT_FALSE(static_cast<bool>(holder));
  {
    auto reservation = registry.reserve("a.mp4");
    ASSERT_TRUE(reservation.has_value());
    holder = std::move(*reservation);
  }
  EXPECT_TRUE(registry.contains("a.mp4"));
  EXPECT_EQ(registry.size(), 1u);

  holder = NameReservation();
  EXPECT_FALSE(registry.contains("a.mp4"));
  EXPECT_EQ(registry.size(), 0u);
}

} // namespace
} // namespace ingest_service
