#include <doctest/doctest.h>
#include <mefw/module_content.hpp>

#include "image_builder.hpp"

#include <lzma.h>

#include <cstring>

using namespace mefw;
using namespace mefw::test;

namespace {

const std::string TEXT =
    "The quick brown fox jumps over the lazy dog. The quick brown fox jumps over the lazy dog.";

Bytes text_bytes() {
    return Bytes(TEXT.begin(), TEXT.end());
}

// LZMA "alone" stream with the given literal and position settings
Bytes lzma_alone(const Bytes& input, uint32_t lc, uint32_t lp, uint32_t pb, uint32_t dict_size) {
    lzma_options_lzma opt;
    REQUIRE(lzma_lzma_preset(&opt, 6) == false);
    opt.lc = lc;
    opt.lp = lp;
    opt.pb = pb;
    opt.dict_size = dict_size;

    lzma_stream strm = LZMA_STREAM_INIT;
    REQUIRE(lzma_alone_encoder(&strm, &opt) == LZMA_OK);

    Bytes out(input.size() + 1024);
    strm.next_in = input.data();
    strm.avail_in = input.size();
    strm.next_out = out.data();
    strm.avail_out = out.size();
    lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
    out.resize(out.size() - strm.avail_out);
    lzma_end(&strm);
    REQUIRE(ret == LZMA_STREAM_END);
    return out;
}

// CSME pads the header with three zero bytes
Bytes me_lzma(const Bytes& input) {
    Bytes alone = lzma_alone(input, 0, 1, 1, 0x4000);
    Bytes out(alone.begin(), alone.begin() + 0x0E);
    out.insert(out.end(), 3, 0);
    out.insert(out.end(), alone.begin() + 0x0E, alone.end());
    return out;
}

Bytes met(uint8_t compression, uint32_t uncompressed, uint32_t compressed) {
    return extension(EXT_MODULE_ATTRIBUTES,
                     module_attributes_payload(compression, uncompressed, compressed));
}

ParseResult parse_content_image() {
    Bytes lz = lzma_alone(text_bytes(), 3, 0, 2, 1u << 16);
    Bytes me = me_lzma(text_bytes());

    ImageSpec spec;
    spec.partitions.push_back(
        {"FTPR", cpd("FTPR", {{"FTPR.man", manifest({})},
                              {"raw", text_bytes()},
                              {"lz", lz},
                              {"lz.met", met(2, static_cast<uint32_t>(TEXT.size()),
                                             static_cast<uint32_t>(lz.size()))},
                              {"me", me},
                              {"me.met", met(2, static_cast<uint32_t>(TEXT.size()),
                                             static_cast<uint32_t>(me.size()))},
                              {"huff", Bytes(0x80, 0x5A)},
                              {"huff.met", met(1, 0x1000, 0x40)},
                              {"bup", Bytes(0x20, 0x11), true},
                              {"far", {}, false, 0x9000, 0x10}})});
    spec.partitions.push_back({"FTUP", gen2_partition("FTUP", {{"BUP", Bytes(0x30, 0x22)}})});
    return parse_image(make_image(image(spec)));
}

const ModuleRef* find_module(const std::vector<ModuleRef>& modules, const std::string& name) {
    for (const auto& m : modules) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

class FixedDecompressor : public Decompressor {
public:
    FixedDecompressor(Compression kind, Bytes data) : kind_(kind), data_(std::move(data)) {}

    Compression kind() const override { return kind_; }

    DecompressResult decompress(const ByteView&, size_t) const override {
        DecompressResult result;
        result.ok = true;
        result.data = data_;
        return result;
    }

private:
    Compression kind_;
    Bytes data_;
};

} // namespace

TEST_CASE("list_modules skips manifests and metadata") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);

    std::vector<std::string> names;
    for (const auto& m : modules) names.push_back(m.name);
    CHECK(names == std::vector<std::string>{"raw", "lz", "me", "huff", "bup", "far", "BUP"});

    const ModuleRef* raw = find_module(modules, "raw");
    REQUIRE(raw != nullptr);
    CHECK(raw->partition == "FTPR");
    CHECK(raw->source == ModuleSource::Cpd);
    CHECK(raw->compression == Compression::None);
    CHECK(raw->range.length == TEXT.size());

    const ModuleRef* lz = find_module(modules, "lz");
    REQUIRE(lz != nullptr);
    CHECK(lz->compression == Compression::Lzma);
    CHECK(lz->uncompressed_size == TEXT.size());

    const ModuleRef* huff = find_module(modules, "huff");
    REQUIRE(huff != nullptr);
    CHECK(huff->compression == Compression::Huffman);
    CHECK(huff->range.length == 0x40);
    CHECK(huff->uncompressed_size == 0x1000);

    const ModuleRef* bup = find_module(modules, "bup");
    REQUIRE(bup != nullptr);
    CHECK(bup->compression == Compression::Huffman);

    const ModuleRef* far = find_module(modules, "far");
    REQUIRE(far != nullptr);
    CHECK_FALSE(far->range_valid);

    const ModuleRef* gen2 = find_module(modules, "BUP");
    REQUIRE(gen2 != nullptr);
    CHECK(gen2->partition == "FTUP");
    CHECK(gen2->source == ModuleSource::Gen2);
}

TEST_CASE("uncompressed module content is copied") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);
    auto registry = DecompressorRegistry::with_defaults();

    DiagnosticSink sink;
    auto content = read_module_content(parsed.model, *find_module(modules, "raw"), registry, sink);
    REQUIRE(content.ok);
    CHECK(content.data == text_bytes());

    auto gen2 = read_module_content(parsed.model, *find_module(modules, "BUP"), registry, sink);
    REQUIRE(gen2.ok);
    CHECK(gen2.data == Bytes(0x30, 0x22));
    CHECK(sink.all().empty());
}

TEST_CASE("LZMA modules are decompressed") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);
    auto registry = DecompressorRegistry::with_defaults();

    DiagnosticSink sink;
    auto lz = read_module_content(parsed.model, *find_module(modules, "lz"), registry, sink);
    REQUIRE(lz.ok);
    CHECK(lz.data == text_bytes());

    // Padded CSME header variant
    auto me = read_module_content(parsed.model, *find_module(modules, "me"), registry, sink);
    REQUIRE(me.ok);
    CHECK(me.data == text_bytes());
    CHECK(sink.all().empty());
}

TEST_CASE("corrupt LZMA data is an error") {
    LzmaDecompressor lzma;
    Bytes garbage(0x40, 0xEE);
    auto result = lzma.decompress(ByteView{garbage.data(), garbage.size()}, 0);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
    CHECK(result.data.empty());
}

TEST_CASE("Huffman modules report unsupported compression") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);
    auto registry = DecompressorRegistry::with_defaults();

    DiagnosticSink sink;
    auto result = read_module_content(parsed.model, *find_module(modules, "huff"), registry, sink);
    CHECK_FALSE(result.ok);
    CHECK(result.error == "unsupported compression: huffman");

    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].kind == DiagnosticKind::unsupported_compression);
    CHECK(diags[0].layer == Layer::Content);
    CHECK(diags[0].partition == "FTPR");
}

TEST_CASE("registered decompressors extend and override the defaults") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);

    auto registry = DecompressorRegistry::with_defaults();
    registry.add(std::make_unique<FixedDecompressor>(Compression::Huffman, Bytes{1, 2, 3}));
    registry.add(std::make_unique<FixedDecompressor>(Compression::Lzma, Bytes{9}));
    registry.add(nullptr);

    DiagnosticSink sink;
    auto huff = read_module_content(parsed.model, *find_module(modules, "huff"), registry, sink);
    REQUIRE(huff.ok);
    CHECK(huff.data == Bytes{1, 2, 3});

    auto lz = read_module_content(parsed.model, *find_module(modules, "lz"), registry, sink);
    REQUIRE(lz.ok);
    CHECK(lz.data == Bytes{9});

    CHECK(registry.find(Compression::Unknown) == nullptr);
    CHECK(DecompressorRegistry().find(Compression::Lzma) == nullptr);
}

TEST_CASE("modules outside their partition cannot be read") {
    auto parsed = parse_content_image();
    REQUIRE(parsed.ok);
    auto modules = list_modules(parsed.model);
    auto registry = DecompressorRegistry::with_defaults();

    DiagnosticSink sink;
    auto result = read_module_content(parsed.model, *find_module(modules, "far"), registry, sink);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("outside") != std::string::npos);
}

TEST_CASE("SHA-256 digests") {
    std::string abc = "abc";
    auto hash = compute_sha256(Bytes(abc.begin(), abc.end()));
    REQUIRE(hash.ok);
    CHECK(hash.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = compute_sha256({});
    REQUIRE(empty.ok);
    CHECK(empty.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
