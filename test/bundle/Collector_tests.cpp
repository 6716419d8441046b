#include <bundle/Collector.hpp>
#include <lang/Language.hpp>
#include <util/TmpDir.hpp>

#include <catch2/catch.hpp>

namespace {
    bundle::Files collect(const test::TmpDir &tmp, const std::vector<std::string> &languages)
    {
        bundle::Files files;
        bundle::Collector collector{bundle::Collector::Config{
            .root = tmp.dir(),
            .extensions = lang::extensions(languages),
        }};
        REQUIRE(collector.collect(files) == ReturnCode::Ok);
        return files;
    }
} // namespace

TEST_CASE("recursive filter by extension", "[ut][bundle][Collector]")
{
    const test::TmpDir tmp{"collector_filter"};
    tmp.write("a.py", "a");
    tmp.write("sub/deep/b.PY", "b");
    tmp.write("c.cs", "c");
    tmp.write("d.txt", "d");
    tmp.write("web/index.htm", "e");

    SECTION("python only")
    {
        const auto files = collect(tmp, {"python"});
        REQUIRE(files.size() == 2);
        for (const auto &fp : files)
            REQUIRE(fp.is_absolute());
    }
    SECTION("unknown language yields nothing")
    {
        REQUIRE(collect(tmp, {"cobol"}).empty());
    }
    SECTION("all equals every language")
    {
        const auto all = collect(tmp, {"all"});
        REQUIRE(all.size() == 4);
        REQUIRE(all == collect(tmp, {"csharp", "python", "javascript", "java", "html", "css", "jsx", "angular"}));
    }
}

TEST_CASE("exclude the output file", "[ut][bundle][Collector]")
{
    const test::TmpDir tmp{"collector_exclude"};
    tmp.write("a.py", "a");
    const auto out = tmp.write("bundle.py", "old bundle");

    bundle::Files files;
    bundle::Collector collector{bundle::Collector::Config{
        .root = tmp.dir(),
        .extensions = {".py"},
        .exclude = out,
    }};
    REQUIRE(collector.collect(files) == ReturnCode::Ok);
    REQUIRE(files.size() == 1);
    REQUIRE(files[0].filename() == "a.py");
}
