#include <gtest/gtest.h>
#include <sstream>
#include "table/type_codec.hpp"

using namespace cfgdb::table;
using cfgdb::redis::Hash;

class TypeCodecTest : public ::testing::Test {
protected:
  using List = std::vector<std::string>;
};

TEST_F(TypeCodecTest, ScalarFieldsAreStoredAsIs) {
  Row row{{"mtu", std::string("9100")}, {"admin_status", std::string("up")}};
  Hash raw = TypeCodec::typed_to_raw(row);
  EXPECT_EQ(raw, (Hash{{"mtu", "9100"}, {"admin_status", "up"}}));
  EXPECT_EQ(TypeCodec::raw_to_typed(raw), row);
}

TEST_F(TypeCodecTest, ListFieldsGetSuffixAndDelimiter) {
  Row row{{"ports", List{"Ethernet0", "Ethernet4"}}};
  Hash raw = TypeCodec::typed_to_raw(row);
  EXPECT_EQ(raw, (Hash{{"ports@", "Ethernet0,Ethernet4"}}));
  EXPECT_EQ(TypeCodec::raw_to_typed(raw), row);
}

TEST_F(TypeCodecTest, SingleItemListStaysAList) {
  Row decoded = TypeCodec::raw_to_typed(Hash{{"members@", "Ethernet8"}});
  ASSERT_EQ(decoded.count("members"), 1u);
  ASSERT_TRUE(is_list(decoded["members"]));
  EXPECT_EQ(std::get<List>(decoded["members"]), List{"Ethernet8"});
}

TEST_F(TypeCodecTest, EmptyRowIsStoredAsNullMarker) {
  Hash raw = TypeCodec::typed_to_raw(Row{});
  EXPECT_EQ(raw, (Hash{{"NULL", "NULL"}}));
  EXPECT_TRUE(TypeCodec::raw_to_typed(raw).empty());
}

TEST_F(TypeCodecTest, NullMarkerIsDroppedNextToRealFields) {
  Row decoded = TypeCodec::raw_to_typed(Hash{{"NULL", "NULL"}, {"speed", "40000"}});
  EXPECT_EQ(decoded, (Row{{"speed", std::string("40000")}}));
}

TEST_F(TypeCodecTest, MixedRowRoundTrips) {
  Row row{
    {"alias", std::string("fortyGigE0/0")},
    {"lanes", List{"29", "30", "31", "32"}},
    {"description", std::string("")}
  };
  EXPECT_EQ(TypeCodec::raw_to_typed(TypeCodec::typed_to_raw(row)), row);
}

TEST_F(TypeCodecTest, RawFieldNameFollowsValueKind) {
  EXPECT_EQ(TypeCodec::raw_field_name("mtu", std::string("9100")), "mtu");
  EXPECT_EQ(TypeCodec::raw_field_name("ports", List{"a"}), "ports@");
}

TEST_F(TypeCodecTest, RowKeyPrintsPartsAsTuple) {
  std::ostringstream scalar, composite;
  scalar << RowKey("Vlan100");
  composite << RowKey{"Vlan100", "Ethernet0"};
  EXPECT_EQ(scalar.str(), "Vlan100");
  EXPECT_EQ(composite.str(), "(Vlan100, Ethernet0)");
}
