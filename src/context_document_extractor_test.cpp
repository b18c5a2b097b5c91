/**
 * @file context_document_extractor_test.cpp
 * @brief Unit tests for context document extraction
 */

#include "context_document_extractor.h"
#include <iostream>
#include <string>
#include <cassert>

using namespace chatmine;

struct ContextDocumentExtractorTest {
    void run_all_tests() {
        test_separated_documents();
        test_next_id_ends_content();
        test_json_tail_ends_content();
        test_escaped_newlines();
        test_escaped_newlines_disabled();
        test_inline_title();
        test_incomplete_records();
        test_clean_content();

        std::cout << "All ContextDocumentExtractor tests passed." << std::endl;
    }

private:
    AnalyzerConfig config_;

    void test_separated_documents() {
        std::cout << "Testing documents separated by dashes... ";

        ContextDocumentExtractor extractor(config_);
        auto documents = extractor.extract(
            "ID: 1\n"
            "├── Title: First\n"
            "└── Content: alpha\n"
            "more alpha\n"
            "------\n"
            "ID: 2\n"
            "├── Title: Second\n"
            "└── Content: beta");

        assert(documents.size() == 2);
        assert(documents[0].id == "1");
        assert(documents[0].title == "First");
        assert(documents[0].content == "alpha\nmore alpha");
        assert(documents[1].id == "2");
        assert(documents[1].title == "Second");
        assert(documents[1].content == "beta");

        std::cout << "PASSED" << std::endl;
    }

    void test_next_id_ends_content() {
        std::cout << "Testing next ID line ending content... ";

        ContextDocumentExtractor extractor(config_);
        auto documents = extractor.extract(
            "ID: 10\n├── Title: A\n└── Content: one\n"
            "ID: 11\n├── Title: B\n└── Content: two");

        assert(documents.size() == 2);
        assert(documents[0].content == "one");
        assert(documents[1].id == "11");
        assert(documents[1].content == "two");

        std::cout << "PASSED" << std::endl;
    }

    void test_json_tail_ends_content() {
        std::cout << "Testing JSON tail ending content... ";

        ContextDocumentExtractor extractor(config_);
        auto comma_tail = extractor.extract(
            "ID: 5\n├── Title: T\n└── Content: body\n"
            "  },\n"
            "{\"role\":\"user\",\"content\":\"q\"}");
        assert(comma_tail.size() == 1);
        assert(comma_tail[0].content == "body");

        auto bracket_tail = extractor.extract(
            "ID: 6\n├── Title: T\n└── Content: last body\n"
            "] }");
        assert(bracket_tail.size() == 1);
        assert(bracket_tail[0].content == "last body");

        std::cout << "PASSED" << std::endl;
    }

    void test_escaped_newlines() {
        std::cout << "Testing escaped newlines in raw JSON... ";

        ContextDocumentExtractor extractor(config_);
        auto documents = extractor.extract(
            "2024-01-01 10:00:00,000 INFO [HISTORY][{\"role\":\"system\",\"content\":\""
            "ID: 7\\n├── Title: Escaped\\n└── Content: line one\\nline two\"}]");

        assert(documents.size() == 1);
        assert(documents[0].id == "7");
        assert(documents[0].title == "Escaped");
        assert(documents[0].content.rfind("line one\nline two", 0) == 0);

        std::cout << "PASSED" << std::endl;
    }

    void test_escaped_newlines_disabled() {
        std::cout << "Testing escaped newlines left alone... ";

        AnalyzerConfig config;
        config.unescape_newlines = false;
        ContextDocumentExtractor extractor(config);
        auto documents = extractor.extract(
            "ID: 7\\n├── Title: Escaped\\n└── Content: line one");
        assert(documents.empty());

        std::cout << "PASSED" << std::endl;
    }

    void test_inline_title() {
        std::cout << "Testing record on a single line... ";

        ContextDocumentExtractor extractor(config_);
        auto documents = extractor.extract("ID: 3 ├── Title: Inline └── Content: same line");

        assert(documents.size() == 1);
        assert(documents[0].title == "Inline");
        assert(documents[0].content == "same line");

        std::cout << "PASSED" << std::endl;
    }

    void test_incomplete_records() {
        std::cout << "Testing incomplete records... ";

        ContextDocumentExtractor extractor(config_);
        assert(extractor.extract("").empty());
        assert(extractor.extract("nothing to see").empty());
        assert(extractor.extract("ID: abc\n├── Title: T\n└── Content: x").empty());
        assert(extractor.extract("ID: 4\n├── Title: \n└── Content: x").empty());
        assert(extractor.extract("ID: 4\n├── Title: T\nContent: x").empty());

        // A broken record does not hide a later valid one
        auto documents = extractor.extract(
            "ID: 1\n├── oops\n"
            "ID: 2\n├── Title: Good\n└── Content: kept");
        assert(documents.size() == 1);
        assert(documents[0].id == "2");

        std::cout << "PASSED" << std::endl;
    }

    void test_clean_content() {
        std::cout << "Testing content cleanup... ";

        assert(ContextDocumentExtractor::clean_content("  plain  ") == "plain");
        assert(ContextDocumentExtractor::clean_content("body}]}") == "body");
        assert(ContextDocumentExtractor::clean_content("body},]") == "body");
        assert(ContextDocumentExtractor::clean_content("body } , ] }") == "body");
        assert(ContextDocumentExtractor::clean_content("body]") == "body]");
        assert(ContextDocumentExtractor::clean_content("list [a, b]") == "list [a, b]");
        assert(ContextDocumentExtractor::clean_content("").empty());

        std::cout << "PASSED" << std::endl;
    }
};

int main() {
    try {
        ContextDocumentExtractorTest test;
        test.run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
