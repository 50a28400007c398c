#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdstrip/converter.hpp>
#include <mdstrip/removal_ledger.hpp>

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace {

[[nodiscard]] std::size_t count_occurrences(
    const std::string_view haystack, const std::string_view needle)
{
    std::size_t result = 0;

    for (std::size_t pos = haystack.find(needle);
         pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size()))
    {
        ++result;
    }

    return result;
}

std::string do_test_convert(const std::string_view source,
    const std::string_view expected, mdstrip::removal_ledger* ledger = nullptr,
    const mdstrip::converter::config& cfg = {},
    std::ostream& err_stream = std::cerr)
{
    std::ostringstream dbg_stream;
    mdstrip::converter cnvtr{err_stream, dbg_stream};

    std::string output = cnvtr.convert(cfg, source, ledger);
    REQUIRE(output == expected);

    return output;
}

} // namespace

TEST_CASE("converter ctor/dtor")
{
    mdstrip::converter c{std::cerr, std::cout};
    (void)c;
}

TEST_CASE("converter convert #0")
{
    do_test_convert("", "");
    do_test_convert("  \n\n \t ", "");
    do_test_convert("plain text stays", "plain text stays");
}

TEST_CASE("converter convert emphasis")
{
    mdstrip::removal_ledger ledger;

    do_test_convert("**bold** and *italic* and ***both***",
        "bold and italic and both", &ledger);

    REQUIRE(ledger.count("bold_asterisks") == 1);
    REQUIRE(ledger.count("italic_asterisks") == 1);
    REQUIRE(ledger.count("bold_italic") == 1);
    REQUIRE(ledger.total_fragments() == 3);
}

TEST_CASE("converter convert links and images")
{
    mdstrip::removal_ledger ledger;

    do_test_convert("[Example](http://example.com)", "Example", &ledger);
    do_test_convert("![alt text](img.png)", "alt text", &ledger);

    REQUIRE(ledger.find("links")->_fragments[0] ==
            "[Example](http://example.com)");
    REQUIRE(ledger.find("images")->_fragments[0] == "![alt text](img.png)");
}

TEST_CASE("converter convert table separator")
{
    mdstrip::removal_ledger ledger;

    do_test_convert("| A | B |\n|---|---|", "| A | B |", &ledger);

    REQUIRE(ledger.count("table_separators") == 1);
    REQUIRE(ledger.find("table_separators")->_fragments[0] == "|---|---|");
}

TEST_CASE("converter convert code block")
{
    const std::string_view source = R"(Intro

```python
print("**not bold**")
```

Outro)"sv;

    mdstrip::removal_ledger ledger;
    const std::string output =
        do_test_convert(source, "Intro\n\n[CODE BLOCK]\n\nOutro", &ledger);

    REQUIRE(count_occurrences(output, "[CODE BLOCK]") == 1);
    REQUIRE(ledger.count("code_blocks") == 1);
    REQUIRE(ledger.find("code_blocks")->_fragments[0] ==
            "```python\nprint(\"**not bold**\")\n```");
    REQUIRE(ledger.find("bold_asterisks") == nullptr);
}

TEST_CASE("converter convert unterminated code block")
{
    const std::string_view source = R"(Before
```
secret code
more code)"sv;

    std::ostringstream oss;
    mdstrip::removal_ledger ledger;

    const std::string output =
        do_test_convert(source, "Before\n[CODE BLOCK]", &ledger, {}, oss);

    REQUIRE(output.find("secret code") == std::string::npos);
    REQUIRE(count_occurrences(oss.str(), "((MDSTRIP WARNING))") == 1);
    REQUIRE(oss.str().find("Unclosed code block starting at line 2") !=
            std::string::npos);
    REQUIRE(ledger.find("code_blocks_unclosed")->_fragments[0] ==
            "```\nsecret code\nmore code");
}

TEST_CASE("converter convert escapes")
{
    do_test_convert(R"(\*literal\*)", "*literal*");
    do_test_convert(R"(\q)", R"(\q)");
    do_test_convert(R"(1\. not a list)", "1. not a list");
}

TEST_CASE("converter convert escaped backslash before emphasis")
{
    mdstrip::removal_ledger ledger;

    do_test_convert(R"(C:\\*dir*)", R"(C:\dir)", &ledger);
    do_test_convert(R"(**bold\\**)", R"(bold\)", &ledger);

    REQUIRE(ledger.count("italic_asterisks") == 1);
    REQUIRE(ledger.count("bold_asterisks") == 1);
    REQUIRE(ledger.count("escaped_characters") == 2);
}

TEST_CASE("converter convert whitespace collapse")
{
    mdstrip::removal_ledger ledger;

    do_test_convert("\n  First paragraph.  \n\n\n\n\nSecond paragraph.\n\n",
        "First paragraph.\n\nSecond paragraph.", &ledger);

    REQUIRE(ledger.find("excessive_whitespace")->_fragments[0] ==
            "Found 1 instances of 3+ consecutive newlines");
}

TEST_CASE("converter convert whitespace-only lines collapse")
{
    do_test_convert("a\n   \n\t\n  \nb", "a\n\nb");
}

TEST_CASE("converter convert headers")
{
    do_test_convert("# Title\n\nBody", "Title\n\nBody");
    do_test_convert("Title\n=====\n\nBody", "Title\n\nBody");
    do_test_convert("Sub\n---\nBody", "Sub\nBody");
}

TEST_CASE("converter convert lists")
{
    const std::string_view source = R"(Shopping:

- eggs
- [x] milk
* [ ] bread
1. first
2. second)"sv;

    const std::string_view expected = R"(Shopping:

eggs
milk
bread
first
second)"sv;

    mdstrip::removal_ledger ledger;
    do_test_convert(source, expected, &ledger);

    REQUIRE(ledger.count("task_lists") == 2);
    REQUIRE(ledger.count("unordered_lists") == 1);
    REQUIRE(ledger.count("ordered_lists") == 2);
}

TEST_CASE("converter convert reference links")
{
    do_test_convert("See [docs][1].\n\n[1]: https://example.com", "See docs.");
}

TEST_CASE("converter convert blockquotes")
{
    do_test_convert("> quoted\n> > deeper", "quoted\ndeeper");
}

TEST_CASE("converter convert footnotes")
{
    mdstrip::removal_ledger ledger;

    do_test_convert("Claim[^1].\n\n[^1]: Source.", "Claim.", &ledger);

    REQUIRE(ledger.count("footnote_references") == 1);
    REQUIRE(ledger.count("footnote_definitions") == 1);
    REQUIRE(ledger.find("reference_link_definitions") == nullptr);
}

TEST_CASE("converter convert html and strikethrough")
{
    do_test_convert(
        "~~old~~ new <span>inline</span> text", "old new inline text");
}

TEST_CASE("converter convert document")
{
    const std::string_view source = R"(# Project Title

Some **bold** text and *italic* text.

> A quoted line

- item one
- item two

1. first
2. second

- [x] finished task

See [the site](https://example.com) and ![logo](logo.png).

| Name | Value |
|------|-------|
| a    | 1     |

Footnote here[^1].

[^1]: The footnote text.

***

~~old~~ new <span>inline</span>
)"sv;

    const std::string_view expected = R"(Project Title

Some bold text and italic text.

A quoted line

item one
item two

first
second

finished task

See the site and logo.

| Name | Value |
| a    | 1     |

Footnote here.

old new inline)"sv;

    mdstrip::removal_ledger ledger;
    const std::string output = do_test_convert(source, expected, &ledger);

    const auto& categories = ledger.categories();
    REQUIRE(categories.size() == 16);
    REQUIRE(categories[0]._name == "hash_headers");
    REQUIRE(categories[1]._name == "bold_asterisks");
    REQUIRE(categories[2]._name == "italic_asterisks");
    REQUIRE(categories[3]._name == "images");
    REQUIRE(categories[4]._name == "links");
    REQUIRE(categories[5]._name == "task_lists");
    REQUIRE(categories[6]._name == "unordered_lists");
    REQUIRE(categories[7]._name == "ordered_lists");
    REQUIRE(categories[8]._name == "blockquotes");
    REQUIRE(categories[9]._name == "horizontal_rules");
    REQUIRE(categories[10]._name == "table_separators");
    REQUIRE(categories[11]._name == "html_tags");
    REQUIRE(categories[12]._name == "strikethrough");
    REQUIRE(categories[13]._name == "footnote_references");
    REQUIRE(categories[14]._name == "footnote_definitions");
    REQUIRE(categories[15]._name == "excessive_whitespace");

    // Converting clean output again removes nothing.
    mdstrip::removal_ledger second_ledger;
    do_test_convert(output, output, &second_ledger);
    REQUIRE(second_ledger.empty());
}

TEST_CASE("converter convert json-wrapped input")
{
    do_test_convert(R"("content": "# Title\n\nSome **bold** text")",
        "Title\n\nSome bold text");

    do_test_convert(R"("quote": "say \"hi\" twice")", R"(say "hi" twice)");

    const mdstrip::converter::config raw_cfg{.unwrap_json_input = false};
    do_test_convert(R"("content": "# Title\n\nSome **bold** text")",
        R"("content": "# Title\n\nSome bold text")", nullptr, raw_cfg);
}

TEST_CASE("converter convert max span")
{
    const mdstrip::converter::config cfg{.max_span = 4};

    do_test_convert("**long text** and **ok**", "**long text** and ok",
        nullptr, cfg);
}

TEST_CASE("converter convert debug report")
{
    const std::string_view source = "# Title\n\n**bold**"sv;

    std::ostringstream err_stream;
    std::ostringstream dbg_stream;
    mdstrip::converter cnvtr{err_stream, dbg_stream};

    const std::string quiet = cnvtr.convert({}, source);
    REQUIRE(dbg_stream.str().empty());

    const std::string verbose = cnvtr.convert({.emit_debug = true}, source);
    REQUIRE(verbose == quiet);

    const std::string report = dbg_stream.str();
    REQUIRE(report.find("Starting conversion - original length: 17\n") !=
            std::string::npos);
    REQUIRE(report.find("Step 1 - Code blocks: 17 -> 17 (diff: 0)\n") !=
            std::string::npos);
    REQUIRE(report.find("Step 3 - Hash headers: 17 -> 15 (diff: 2)\n") !=
            std::string::npos);
    // Each step starts from the length the previous step ended with.
    REQUIRE(report.find("Step 4 - Underline headers: 15 -> 15 (diff: 0)\n") !=
            std::string::npos);
    REQUIRE(report.find("Step 5 - All emphasis: 15 -> 11 (diff: 4)\n") !=
            std::string::npos);
    REQUIRE(report.find("Step 17 - Clean whitespace:") != std::string::npos);
    REQUIRE(report.find("Final length: 11 (total reduction: 6)\n") !=
            std::string::npos);
    REQUIRE(count_occurrences(report, "Step ") == 17);
    REQUIRE(err_stream.str().empty());
}

TEST_CASE("converter convert without ledger matches ledger run")
{
    const std::string_view source = "> *a* [b](c) `d` ~~e~~ <f>g</f>"sv;

    mdstrip::removal_ledger ledger;
    const std::string with_ledger =
        do_test_convert(source, "a b d e g", &ledger);

    do_test_convert(source, with_ledger);
    REQUIRE(!ledger.empty());
}

TEST_CASE("converter convert adversarial input terminates")
{
    std::ostringstream oss;

    do_test_convert(std::string(200000, '*'), "", nullptr, {}, oss);

    std::string brackets;
    for (int i = 0; i < 20000; ++i)
    {
        brackets.append("[![a](");
    }

    mdstrip::converter cnvtr{oss, oss};
    const std::string output = cnvtr.convert({}, brackets);
    REQUIRE(output == brackets);

    std::string fences;
    for (int i = 0; i < 5001; ++i)
    {
        fences.append("```\nx\n");
    }

    const std::string fenced_output = cnvtr.convert({}, fences);
    REQUIRE(count_occurrences(fenced_output, "[CODE BLOCK]") == 2501);
    REQUIRE(count_occurrences(oss.str(), "Unclosed code block") == 1);
}
