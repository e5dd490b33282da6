#include "common.hpp"

#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using toolwire::sanitize_name;
using toolwire::split_command;

typedef std::vector<std::string> args_t;

static void test_split_command() {
    assert(split_command("uvx seekdb-mcp-server") == args_t({"uvx", "seekdb-mcp-server"}));
    assert(split_command("  server   --flag\tvalue  ") == args_t({"server", "--flag", "value"}));
    assert(split_command("").empty());
    assert(split_command("   ").empty());

    assert(split_command("run 'two words' \"and three words\"") ==
           args_t({"run", "two words", "and three words"}));
    assert(split_command("a'b'\"c\"d") == args_t({"abcd"}));
    assert(split_command("say \"quote \\\" inside\"") == args_t({"say", "quote \" inside"}));
    assert(split_command("say 'no \\ escape'") == args_t({"say", "no \\ escape"}));
    assert(split_command("path\\ with\\ spaces") == args_t({"path with spaces"}));
    assert(split_command("empty '' arg") == args_t({"empty", "", "arg"}));

    const char * bad[] = { "unterminated 'quote", "unterminated \"quote", "trailing\\" };
    for (const char * command : bad) {
        bool rejected = false;
        try {
            split_command(command);
        } catch (const std::invalid_argument &) {
            rejected = true;
        }
        assert(rejected);
    }
}

static void test_sanitize_name() {
    assert(sanitize_name("projects") == "projects");
    assert(sanitize_name("my-projects.v2") == "my_projects_v2");
    assert(sanitize_name("a b/c") == "a_b_c");
    assert(sanitize_name("") == "");
}

int main() {
    test_split_command();
    test_sanitize_name();

    printf("test-common: OK\n");
    return 0;
}
