#ifndef HEADER_test_util_TmpDir_hpp_ALREADY_INCLUDED
#define HEADER_test_util_TmpDir_hpp_ALREADY_INCLUDED

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace test {

    // Fresh directory under the system temp directory, removed on destruction
    class TmpDir
    {
    public:
        TmpDir(const std::string &name)
            : dir_(std::filesystem::temp_directory_path() / "srcbundle_tests" / name)
        {
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);
        }
        ~TmpDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        const std::filesystem::path &dir() const { return dir_; }

        std::filesystem::path write(const std::filesystem::path &rel, const std::string &content) const
        {
            const auto fp = dir_ / rel;
            std::filesystem::create_directories(fp.parent_path());
            std::ofstream fo{fp, std::ios::binary};
            fo << content;
            return fp;
        }

        std::string read(const std::filesystem::path &rel) const
        {
            std::ifstream fi{dir_ / rel, std::ios::binary};
            return std::string{std::istreambuf_iterator<char>{fi}, std::istreambuf_iterator<char>{}};
        }

        bool exists(const std::filesystem::path &rel) const { return std::filesystem::exists(dir_ / rel); }

    private:
        std::filesystem::path dir_;
    };

} // namespace test

#endif
