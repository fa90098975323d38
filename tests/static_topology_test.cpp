#include "gtest/gtest.h"
#include "dt_core/topology/TopologyService.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

TEST(StaticTopologyServiceTest, LinkEndpointsAreInternal) {
    StaticTopologyService topology;
    auto links = topology.loadFromJson(json::parse(R"({"edges": [
        {"src_dpid": 1, "src_interface": 3, "dst_dpid": 2, "dst_interface": 1},
        {"src_dpid": "00:00:00:00:00:00:00:02", "src_interface": 1,
         "dst_dpid": "00:00:00:00:00:00:00:01", "dst_interface": 3},
        {"src_dpid": 0, "src_interface": 0, "dst_dpid": 1, "dst_interface": 5}
    ]})"));

    EXPECT_EQ(links, 2u);
    EXPECT_EQ(topology.getLinkCount(), 2u);
    EXPECT_EQ(topology.getSwitchCount(), 2u);
    EXPECT_TRUE(topology.isInternal(1, 3));
    EXPECT_TRUE(topology.isInternal(2, 1));
    EXPECT_FALSE(topology.isInternal(1, 5));
    EXPECT_FALSE(topology.isInternal(3, 1));
}

TEST(StaticTopologyServiceTest, ReloadReplacesLinks) {
    StaticTopologyService topology;
    topology.addLink(1, 1, 2, 2);
    ASSERT_TRUE(topology.isInternal(1, 1));

    topology.loadFromJson(json::parse(R"({"edges": [
        {"src_dpid": 5, "src_interface": 1, "dst_dpid": 6, "dst_interface": 1}
    ]})"));
    EXPECT_FALSE(topology.isInternal(1, 1));
    EXPECT_TRUE(topology.isInternal(5, 1));

    topology.loadFromJson(json::object());
    EXPECT_EQ(topology.getSwitchCount(), 0u);
    EXPECT_FALSE(topology.isInternal(5, 1));
}

TEST(StaticTopologyServiceTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "devtrack_static_topology.json";
    std::ofstream(path) << R"({"edges": [{"src_dpid": 1, "src_interface": 4,
                                          "dst_dpid": 7, "dst_interface": 2}]})";

    StaticTopologyService topology;
    EXPECT_EQ(topology.loadFromFile(path.string()), 1u);
    EXPECT_TRUE(topology.isInternal(7, 2));
    std::filesystem::remove(path);

    EXPECT_THROW(topology.loadFromFile(path.string()), std::runtime_error);
}

TEST(StaticTopologyServiceTest, UnparsableFileIsReported) {
    auto path = std::filesystem::temp_directory_path() / "devtrack_bad_topology.json";
    std::ofstream(path) << "{\"edges\": [";

    StaticTopologyService topology;
    EXPECT_THROW(topology.loadFromFile(path.string()), std::runtime_error);
    std::filesystem::remove(path);
}
