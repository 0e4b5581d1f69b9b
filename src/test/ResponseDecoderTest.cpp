#include <iostream>
#include <cassert>
#include <string>
#include "application/ResponseDecoder.hpp"
#include "domain/Errors.hpp"

using ideasorter::application::ResponseDecoder;
using json = nlohmann::json;

static void testCleanJson() {
    std::cout << "[Test] Clean object and array..." << std::endl;
    json obj = ResponseDecoder::Decode(R"({"group": "compras", "idea": "leche"})");
    assert(obj["group"] == "compras");
    assert(obj["idea"] == "leche");

    json arr = ResponseDecoder::Decode(R"([{"group": "a"}, {"group": "b"}])");
    assert(arr.is_array() && arr.size() == 2);
    std::cout << "[PASS] Clean JSON" << std::endl;
}

static void testFencedBlockWithProse() {
    std::cout << "[Test] Fenced block surrounded by prose..." << std::endl;
    std::string raw = "Here is the classification:\n```json\n{\"group\": \"viajes\", \"idea\": \"Roma\"}\n```\nAnything else?";
    json j = ResponseDecoder::Decode(raw);
    assert(j["group"] == "viajes");
    assert(j["idea"] == "Roma");
    std::cout << "[PASS] Fenced block" << std::endl;
}

static void testBareObjectInProse() {
    std::cout << "[Test] Object embedded in prose without fences..." << std::endl;
    json j = ResponseDecoder::Decode("Sure! {\"group\": \"finanzas\"} hope it helps");
    assert(j["group"] == "finanzas");
    std::cout << "[PASS] Embedded object" << std::endl;
}

static void testRawNewlinesInStrings() {
    std::cout << "[Test] Raw control characters inside strings..." << std::endl;
    json j = ResponseDecoder::Decode("{\"idea\": \"line one\nline two\", \"reason\": \"a\r\nb\tc\"}");
    assert(j["idea"] == "line one line two");
    assert(j["reason"] == "a b c");

    // Newlines between tokens are legal JSON and stay untouched.
    assert(ResponseDecoder::SanitizeStrings("{\n\"a\": 1\n}") == "{\n\"a\": 1\n}");
    std::cout << "[PASS] Control characters" << std::endl;
}

static void testTruncatedOutput() {
    std::cout << "[Test] Truncated output is closed..." << std::endl;
    json open = ResponseDecoder::Decode(R"({"group": "compras", "idea": "pan)");
    assert(open["idea"] == "pan");

    json dangling = ResponseDecoder::Decode(R"({"group": "compras", "idea":)");
    assert(dangling["group"] == "compras");
    assert(dangling["idea"].is_null());

    json comma = ResponseDecoder::Decode(R"({"group": "compras",)");
    assert(comma["group"] == "compras");

    json list = ResponseDecoder::Decode(R"([{"group": "a"}, {"group": "b")");
    assert(list.is_array() && list.size() == 2);
    assert(list[1]["group"] == "b");

    assert(ResponseDecoder::CloseIncomplete(R"({"a": [1, 2)") == R"({"a": [1, 2]})");
    std::cout << "[PASS] Truncation repair" << std::endl;
}

static void testUndecodable() {
    std::cout << "[Test] Undecodable output raises DecodeError..." << std::endl;
    const std::string raw = "I cannot classify that note, sorry.";
    bool thrown = false;
    try {
        ResponseDecoder::Decode(raw);
    } catch (const ideasorter::domain::DecodeError& e) {
        thrown = true;
        assert(e.rawText() == raw);
    }
    assert(thrown);

    // Scalars are not proposals.
    assert(!ResponseDecoder::TryDecode("42").has_value());
    assert(!ResponseDecoder::TryDecode("").has_value());
    std::cout << "[PASS] DecodeError" << std::endl;
}

int main() {
    std::cout << "=== ResponseDecoder Test ===" << std::endl;
    testCleanJson();
    testFencedBlockWithProse();
    testBareObjectInProse();
    testRawNewlinesInStrings();
    testTruncatedOutput();
    testUndecodable();
    std::cout << "=== All ResponseDecoder tests passed ===" << std::endl;
    return 0;
}
