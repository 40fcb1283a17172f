#include <QtTest/QtTest>

#include <stdexcept>

#include "utils/json_parser.hpp"

using namespace parley;

namespace {

bool rejects(const std::string& input) {
    try {
        JsonParser::parseRaw(input);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

class JsonParserTests : public QObject {
    Q_OBJECT

private slots:
    void parseRawKeepsNestedValues();
    void parseDecodesStrings();
    void malformedInputThrows();
    void nestedValuesAreValidated();
    void escapeJsonHandlesControlCharacters();
    void quoteProducesJsonString();
};

void JsonParserTests::parseRawKeepsNestedValues() {
    auto fields = JsonParser::parseRaw(
        "{ \"type\" : \"offer\", \"offer\": {\"sdp\":\"v=0\\r\\n\",\"list\":[1,{\"x\":\"}\"}]},"
        " \"count\": 42, \"flag\": true, \"none\": null }");

    QCOMPARE(int(fields.size()), 5);
    QCOMPARE(QString::fromStdString(fields["type"]), QString("\"offer\""));
    QCOMPARE(QString::fromStdString(fields["offer"]),
             QString("{\"sdp\":\"v=0\\r\\n\",\"list\":[1,{\"x\":\"}\"}]}"));
    QCOMPARE(QString::fromStdString(fields["count"]), QString("42"));
    QCOMPARE(QString::fromStdString(fields["flag"]), QString("true"));
    QCOMPARE(QString::fromStdString(fields["none"]), QString("null"));
    QVERIFY(JsonParser::isStringValue(fields["type"]));
    QVERIFY(JsonParser::isObjectValue(fields["offer"]));
    QVERIFY(!JsonParser::isStringValue(fields["count"]));
}

void JsonParserTests::parseDecodesStrings() {
    auto fields = JsonParser::parse("{\"name\":\"Ren\\u00e9e \\\"R\\\"\",\"path\":\"a\\/b\\tc\",\"n\":7}");

    QCOMPARE(QString::fromStdString(fields["name"]), QString::fromUtf8("Ren\xc3\xa9" "e \"R\""));
    QCOMPARE(QString::fromStdString(fields["path"]), QString("a/b\tc"));
    QCOMPARE(QString::fromStdString(fields["n"]), QString("7"));
    QVERIFY(JsonParser::parse("{}").empty());
}

void JsonParserTests::malformedInputThrows() {
    QVERIFY(rejects(""));
    QVERIFY(rejects("[1,2]"));
    QVERIFY(rejects("\"text\""));
    QVERIFY(rejects("{\"a\":}"));
    QVERIFY(rejects("{\"a\" 1}"));
    QVERIFY(rejects("{\"a\":\"open}"));
    QVERIFY(rejects("{\"a\":{\"b\":1}"));
    QVERIFY(rejects("{\"a\":[1,2}}"));
    QVERIFY(rejects("{\"a\":1} trailing"));
    QVERIFY(!rejects("  {\"a\" : 1 }  "));
}

void JsonParserTests::nestedValuesAreValidated() {
    // Bare words and balanced but invalid nesting must not survive as raw values.
    QVERIFY(rejects("{\"offer\":hello}"));
    QVERIFY(rejects("{\"candidate\":{oops: not json}}"));
    QVERIFY(rejects("{\"a\":tru}"));
    QVERIFY(rejects("{\"a\":truex}"));
    QVERIFY(rejects("{\"a\":01}"));
    QVERIFY(rejects("{\"a\":1.}"));
    QVERIFY(rejects("{\"a\":-}"));
    QVERIFY(rejects("{\"a\":[1,]}"));
    QVERIFY(rejects("{\"a\":[1 2]}"));
    QVERIFY(rejects("{\"a\":{\"b\":1,}}"));
    QVERIFY(rejects("{\"a\":{\"b\" 1}}"));
    QVERIFY(rejects("{\"a\":\"bad \\q escape\"}"));
    QVERIFY(rejects("{\"a\":\"\\u12\"}"));
    QVERIFY(rejects("{\"a\":" + std::string(100, '[') + std::string(100, ']') + "}"));

    auto fields = JsonParser::parseRaw(
        "{\"n\":-1.5e3,\"z\":0,\"list\":[true, false, null, {\"c\": []}, \"\\u00e9\"],\"o\":{ }}");
    QCOMPARE(QString::fromStdString(fields["n"]), QString("-1.5e3"));
    QCOMPARE(QString::fromStdString(fields["z"]), QString("0"));
    QCOMPARE(QString::fromStdString(fields["list"]),
             QString("[true, false, null, {\"c\": []}, \"\\u00e9\"]"));
    QCOMPARE(QString::fromStdString(fields["o"]), QString("{ }"));
}

void JsonParserTests::escapeJsonHandlesControlCharacters() {
    std::string raw = "q\"b\\n\nt\t";
    raw += '\x01';
    QCOMPARE(QString::fromStdString(JsonParser::escapeJson(raw)), QString("q\\\"b\\\\n\\nt\\t\\u0001"));
    QCOMPARE(QString::fromStdString(JsonParser::unescapeJson(JsonParser::escapeJson(raw))),
             QString::fromStdString(raw));
}

void JsonParserTests::quoteProducesJsonString() {
    QCOMPARE(QString::fromStdString(JsonParser::quote("say \"hi\"")), QString("\"say \\\"hi\\\"\""));
    QCOMPARE(QString::fromStdString(JsonParser::decodeString("\"x\\ny\"")), QString("x\ny"));
    QCOMPARE(QString::fromStdString(JsonParser::decodeString("12")), QString("12"));
}

QTEST_MAIN(JsonParserTests)
#include "test_json_parser.moc"
