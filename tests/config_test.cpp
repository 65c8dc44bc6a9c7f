#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "config.h"

using namespace std;

class ConfigTest : public ::testing::Test
{
protected:
    virtual void SetUp()
    {
        ASSERT_TRUE(this->config.Init("../page_reader.ini"));
    }

    Config config;
};

TEST_F(ConfigTest, default_file)
{
    EXPECT_EQ(50, this->config.GetIntValue("contentScorer", "text_density_weight"));
    EXPECT_DOUBLE_EQ(0.5, this->config.GetDoubleValue("contentScorer", "non_content_factor"));
    EXPECT_EQ("data-content-focus", this->config.GetValue("contentLocator", "focus_attribute"));
    EXPECT_TRUE(this->config.GetBoolValue("cache", "enabled"));
    EXPECT_FALSE(this->config.GetBoolValue("htmlSimplifier", "add_content_digests"));

    const vector<string>& names = this->config.GetStringList("contentScorer", "tag_bonus_names");
    const vector<double>& values = this->config.GetDoubleList("contentScorer", "tag_bonus_values");
    ASSERT_EQ(names.size(), values.size());
    EXPECT_EQ("article", names[0]);
    EXPECT_DOUBLE_EQ(-10, values[values.size() - 1]);

    // present but empty
    EXPECT_TRUE(this->config.HasKey("contentLocator", "candidate_selectors"));
    EXPECT_TRUE(this->config.GetStringList("contentLocator", "candidate_selectors", ";").empty());
}

TEST(ConfigParseTest, values_and_defaults)
{
    Config config;
    ASSERT_TRUE(config.InitFromString(
        "# comment\n"
        "; another\n"
        "[a]\n"
        "  int = 42 \n"
        "bad_int = 4x\n"
        "flag = Yes\n"
        "list = x; y ;;z\n"
        "[b]\n"
        "name = value = with equals\n"));

    EXPECT_EQ(42, config.GetIntValue("a", "int"));
    EXPECT_EQ(7, config.GetIntValue("a", "bad_int", 7));
    EXPECT_EQ(9, config.GetIntValue("a", "missing", 9));
    EXPECT_TRUE(config.GetBoolValue("a", "flag"));
    EXPECT_EQ("value = with equals", config.GetValue("b", "name"));
    EXPECT_EQ("fallback", config.GetValue("c", "name", "fallback"));
    EXPECT_FALSE(config.HasKey("c", "name"));

    const vector<string>& list = config.GetStringList("a", "list", ";");
    ASSERT_EQ(3u, list.size());
    EXPECT_EQ("x", list[0]);
    EXPECT_EQ("y", list[1]);
    EXPECT_EQ("z", list[2]);

    config.Set("a", "int", "43");
    EXPECT_EQ(43, config.GetIntValue("a", "int"));
}

TEST(ConfigParseTest, syntax_errors)
{
    Config config;
    EXPECT_FALSE(config.InitFromString("[section\nkey = 1\n"));
    EXPECT_FALSE(config.InitFromString("[s]\nno equals sign\n"));
    EXPECT_FALSE(config.InitFromString("[s]\n= value\n"));
    EXPECT_FALSE(config.Init("no_such_file.ini"));
}

int main(int argc, char* argv[])
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
