#include <cli/App.hpp>
#include <util/TmpDir.hpp>

#include <catch2/catch.hpp>

#include <sstream>

namespace {
    ReturnCode run(cli::Options &options, std::vector<const char *> args, const std::filesystem::path &cwd, const std::string &input, std::string &output, bool restrict = false)
    {
        args.insert(args.begin(), "srcbundle");
        if (options.parse(static_cast<int>(args.size()), args.data()) != ReturnCode::Ok)
            return ReturnCode::Error;

        cli::App app{options};
        if (!restrict)
            app.config().restricted.clear();

        std::istringstream is{input};
        std::ostringstream os;
        const auto rc = app.run(cwd, is, os);
        output = os.str();
        return rc;
    }
} // namespace

TEST_CASE("bundle python files by name", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_scenario"};
    tmp.write("a.py", "print('a')\n");
    tmp.write("z.cs", "class Z {}\n");
    tmp.write("m.py", "\nx = 1\n");

    cli::Options options;
    std::string out;
    REQUIRE(run(options, {"bundle", "-o", "out.txt", "-l", "python", "-s", "name"}, tmp.dir(), "", out) == ReturnCode::Ok);

    REQUIRE(tmp.read("out.txt") == "print('a')\n\n####\n\nx = 1\n\n####\n");
    REQUIRE(out.find("Bundle created at: ") == 0);
}

TEST_CASE("bundle with notes", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_note"};
    const auto fp = tmp.write("sub/b.js", "let b;\n");

    cli::Options options;
    std::string out;
    REQUIRE(run(options, {"bundle", "-o", "out.txt", "-l", "javascript", "-n"}, tmp.dir(), "", out) == ReturnCode::Ok);

    REQUIRE(tmp.read("out.txt") == "// Origin: " + fp.lexically_normal().string() + "\nlet b;\n\n####\n");
}

TEST_CASE("no matching files", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_no_files"};
    tmp.write("z.cs", "class Z {}\n");

    cli::Options options;
    std::string out;
    REQUIRE(run(options, {"bundle", "-o", "out.txt", "-l", "python"}, tmp.dir(), "", out) == ReturnCode::NoFilesFound);
    REQUIRE(!tmp.exists("out.txt"));
}

TEST_CASE("restricted folder writes nothing", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_restricted"};
    tmp.write("Bin/a.py", "a\n");

    cli::Options options;
    std::string out;
    REQUIRE(run(options, {"bundle", "-o", "out.txt", "-l", "python"}, tmp.dir() / "Bin", "", out, true) == ReturnCode::RestrictedFolder);
    REQUIRE(!tmp.exists("Bin/out.txt"));
}

TEST_CASE("no command prints help", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_no_command"};

    cli::Options options;
    std::string out;
    REQUIRE(run(options, {}, tmp.dir(), "", out) == ReturnCode::Ok);
    REQUIRE(out.find("Help for 'srcbundle'") == 0);
    REQUIRE(out.find("Error") == std::string::npos);
}

TEST_CASE("create-rsp round trip", "[ut][cli][App]")
{
    const test::TmpDir tmp{"app_round_trip"};
    std::filesystem::create_directories(tmp.dir() / "dist");
    tmp.write("a.py", "a\n\n");
    tmp.write("b.css", "b {}\n");

    {
        cli::Options options;
        std::string out;
        REQUIRE(run(options, {"create-rsp"}, tmp.dir(), "dist/bundle.txt\npython,css\nyes\ntype\nyes\nargs\n", out) == ReturnCode::Ok);
        REQUIRE(tmp.read("args.rsp") == "output=dist/bundle.txt\nlanguage=python,css\nnote=true\nsort=type\nremoveEmptyLines=true\n");
    }

    cli::Options direct_options;
    direct_options.output = "dist/bundle.txt";
    direct_options.languages = {"python,css"};
    direct_options.note = true;
    direct_options.sort = "type";
    direct_options.remove_empty_lines = true;

    cli::Options rsp_options;
    rsp_options.rsp_file = "args.rsp";

    cli::Config direct, via_rsp;
    direct.restricted.clear();
    via_rsp.restricted.clear();
    REQUIRE(direct.init(direct_options, tmp.dir()) == ReturnCode::Ok);
    REQUIRE(via_rsp.init(rsp_options, tmp.dir()) == ReturnCode::Ok);

    REQUIRE(via_rsp.output == direct.output);
    REQUIRE(via_rsp.languages == direct.languages);
    REQUIRE(via_rsp.note == direct.note);
    REQUIRE(via_rsp.sort == direct.sort);
    REQUIRE(via_rsp.remove_empty_lines == direct.remove_empty_lines);

    {
        cli::Options options;
        std::string out;
        REQUIRE(run(options, {"bundle", "-r", "args.rsp"}, tmp.dir(), "", out) == ReturnCode::Ok);
        const auto a = (tmp.dir() / "a.py").lexically_normal().string();
        const auto b = (tmp.dir() / "b.css").lexically_normal().string();
        REQUIRE(tmp.read("dist/bundle.txt") == "// Origin: " + b + "\nb {}\n\n####\n// Origin: " + a + "\na\n\n####\n");
    }
}
