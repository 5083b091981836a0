#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "data/load/load.hpp"
#include "support.hpp"

namespace Load = Pluvio::Data::Load;
using Pluvio::Test::TemporaryDirectory;

namespace {
    void write_file(const std::filesystem::path& path, const std::string& contents)
    {
        std::ofstream stream(path);
        stream << contents;
    }
}

TEST(LoadDomain, WindowsSeriesAndSkipsInvalidRows)
{
    TemporaryDirectory directory;
    write_file(directory.path() / "link_a.csv",
               "time,attenuation\n"
               "0,0.0\n1,1.0\n2,oops\n3,2.0\n4,3.0\n5,\n6,4.0\n7,5.0\n8,6.0\n9,7.0\n");

    Pluvio::Data::Type::WindowOptions window;
    window.length = 4;
    window.stride = 4;
    window.wet_threshold = 2.5;
    const auto domain = Load::Domain({{directory.path() / "link_a.csv", "", {1.5, 38.0}}}, window);

    // Eight valid readings: 0..7.
    ASSERT_EQ(domain.signals.sizes(), (std::vector<std::int64_t>{2, 1, 4}));
    EXPECT_TRUE(torch::allclose(domain.signals[1][0], torch::tensor({4.0f, 5.0f, 6.0f, 7.0f})));
    EXPECT_EQ(domain.identifiers, (std::vector<std::string>{"link_a", "link_a"}));
    ASSERT_EQ(domain.metadata.sizes(), (std::vector<std::int64_t>{2, 2}));
    EXPECT_NEAR(domain.metadata[1][1].item<double>(), 38.0, 1e-5);
    EXPECT_NEAR(domain.occurrence[0].item<double>(), 0.25, 1e-6);
    EXPECT_NEAR(domain.occurrence[1].item<double>(), 1.0, 1e-6);
}

TEST(LoadDomain, ConcatenatesSourcesWithIdentifiers)
{
    TemporaryDirectory directory;
    write_file(directory.path() / "a.csv", "t,r\n0,1\n1,2\n2,3\n");
    write_file(directory.path() / "b.csv", "t,r\n0,4\n1,5\n2,6\n3,7\n");

    Pluvio::Data::Type::WindowOptions window;
    window.length = 2;
    window.stride = 1;
    const auto domain = Load::Domain({{directory.path() / "a.csv", "gauge_1", {}},
                                      {directory.path() / "b.csv", "gauge_2", {}}}, window);
    EXPECT_EQ(domain.signals.size(0), 5);
    EXPECT_EQ(domain.identifiers.front(), "gauge_1");
    EXPECT_EQ(domain.identifiers.back(), "gauge_2");
    EXPECT_FALSE(domain.metadata.defined());
}

TEST(LoadDomain, ReportsBadInput)
{
    TemporaryDirectory directory;
    Pluvio::Data::Type::WindowOptions window;
    window.length = 4;
    EXPECT_THROW((void)Load::Domain({{directory.path() / "missing.csv", "", {}}}, window), std::runtime_error);
    EXPECT_THROW((void)Load::Domain({}, window), std::invalid_argument);

    write_file(directory.path() / "short.csv", "t,r\n0,1\n");
    EXPECT_THROW((void)Load::Domain({{directory.path() / "short.csv", "", {}}}, window), std::invalid_argument);

    write_file(directory.path() / "one.csv", "t,r\n0,1\n1,1\n2,1\n3,1\n");
    write_file(directory.path() / "two.csv", "t,r\n0,1\n1,1\n2,1\n3,1\n");
    EXPECT_THROW((void)Load::Domain({{directory.path() / "one.csv", "", {1.0}},
                                     {directory.path() / "two.csv", "", {1.0, 2.0}}}, window),
                 std::invalid_argument);
}

TEST(LoadTensor, ReadsSavedTensorsAndReportsMissingFiles)
{
    TemporaryDirectory directory;
    const auto path = directory.path() / "signals.pt";
    auto saved = torch::rand({3, 1, 8});
    torch::save(saved, path.string());
    EXPECT_TRUE(torch::equal(Load::Tensor(path), saved));
    EXPECT_THROW((void)Load::Tensor(directory.path() / "absent.pt"), std::runtime_error);
}
