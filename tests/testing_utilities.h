#ifndef IFREADER_TESTS_TESTING_UTILITIES_H
#define IFREADER_TESTS_TESTING_UTILITIES_H

#include <cstddef>
#include <string>

namespace ifr_test {

/**
 * Line i (1-based) of the generated fixture file:
 * "[i] line number i is ODD" or "[i] line number i is EVEN"
 */
std::string fixture_line(std::size_t i);

class TestEnvironment {
   public:
    TestEnvironment() : TestEnvironment(50) {}
    TestEnvironment(std::size_t lines);
    TestEnvironment(const TestEnvironment&) = delete;
    TestEnvironment& operator=(const TestEnvironment&) = delete;
    ~TestEnvironment();

    const std::string& get_dir() const;
    bool is_valid() const;

    /**
     * Write the ODD/EVEN fixture with the configured number of lines,
     * each terminated by line_ending
     */
    std::string create_test_file(const std::string& line_ending = "\n");

    /**
     * Write arbitrary bytes to a file in the test directory
     */
    std::string create_file(const std::string& name,
                            const std::string& content);

    /**
     * Write a file of roughly target_bytes with lines of varying length
     * (deterministic for a given seed)
     * @return path of the file; the exact content is stored in content_out
     */
    std::string create_random_file(const std::string& name,
                                   std::size_t target_bytes, unsigned seed,
                                   std::string& content_out);

   private:
    std::size_t num_lines;
    std::string test_dir;
};

}  // namespace ifr_test

#endif  // IFREADER_TESTS_TESTING_UTILITIES_H
