#include "gtest/gtest.h"
#include "MockRawCache.hpp"
#include "chunkflow/asyncio/core/EventLoop.hpp"
#include "chunkflow/ndn/chunk/StreamDecoder.hpp"
#include "chunkflow/ndn/chunk/StreamEncoder.hpp"

#include <cstring>

using namespace chunkflow::core;
using namespace chunkflow::asyncio;
using namespace chunkflow::ndn;

static std::shared_ptr<ChunkStreamCache> cache_with(
	ChunkContent const& content,
	uint16_t piece_size,
	std::vector<uint32_t> const& pieces,
	bool async_only = false
) {
	auto cache = ChunkStreamCache::create(content.chunk, piece_size);
	EXPECT_TRUE(cache->load(false, std::make_unique<MemRawCache>(content.chunk.len(), async_only)).ok());
	for(auto index : pieces) {
		auto res = cache->push_piece_data(content.piece(index, piece_size));
		EXPECT_TRUE(res.ok() && res->pushed());
	}
	return cache;
}

static std::vector<uint32_t> all_pieces(uint32_t count) {
	std::vector<uint32_t> res;
	for(uint32_t i = 0; i < count; i++) {
		res.push_back(i);
	}
	return res;
}

/// Poll until a piece comes out, running the loop for async reads in between
static std::optional<PieceData> poll_piece(StreamEncoder& encoder, int rounds = 8) {
	for(int i = 0; i < rounds; i++) {
		uint8_t buf[1400];
		auto n = encoder.next_piece(11, buf, sizeof(buf));
		if(!n.ok()) {
			return std::nullopt;
		}
		if(*n > 0) {
			auto piece = PieceData::decode(Buffer::copy_of(buf, *n));
			if(!piece.ok()) {
				return std::nullopt;
			}
			return std::move(*piece);
		}
		EventLoop::run();
	}
	return std::nullopt;
}

//---------------- Decoder ----------------//

TEST(StreamDecoderTest, FinishesOnLastMissingPiece) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, {});
	StreamDecoder decoder(content.chunk, PieceDesc::full_stream(1024, 256), cache);

	for(uint32_t index : {2, 0, 3, 1}) {
		auto res = decoder.push_piece_data(content.piece(index, 256));
		ASSERT_TRUE(res.ok());
		EXPECT_TRUE(res->pushed());
		EXPECT_EQ(res->finished, index == 1);
	}
	EXPECT_TRUE(decoder.finished());
	EXPECT_FALSE(decoder.require_index().has_value());

	std::vector<uint8_t> out(1024);
	auto read = cache->sync_try_read(PieceDesc::full_stream(1024, 256), out.data(), out.size());
	ASSERT_TRUE(read.ok());
	EXPECT_EQ(out, content.bytes);
}

TEST(StreamDecoderTest, RejectsOutOfWindowPiece) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, {});
	StreamDecoder decoder(content.chunk, PieceDesc::stream(0, 2, 256), cache);

	auto res = decoder.push_piece_data(content.piece(3, 256));

	ASSERT_TRUE(res.ok());
	EXPECT_FALSE(res->valid);
	EXPECT_FALSE(res->exists);
	EXPECT_FALSE(res->finished);
	EXPECT_FALSE(cache->exists(3));
}

TEST(StreamDecoderTest, RejectsStreamPiece) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, {});
	StreamDecoder decoder(content.chunk, PieceDesc::full_stream(1024, 256), cache);
	auto piece = content.piece(0, 256);
	piece.desc = PieceDesc::stream(0, 1, 256);

	auto res = decoder.push_piece_data(piece);

	ASSERT_TRUE(res.ok());
	EXPECT_FALSE(res->valid);
	EXPECT_FALSE(cache->exists(0));
}

TEST(StreamDecoderTest, SubWindowFinishesBeforeChunk) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, {});
	StreamDecoder decoder(content.chunk, PieceDesc::stream(2, 4, 256), cache);

	auto first = decoder.push_piece_data(content.piece(2, 256));
	auto second = decoder.push_piece_data(content.piece(3, 256));

	ASSERT_TRUE(first.ok());
	ASSERT_TRUE(second.ok());
	EXPECT_FALSE(first->finished);
	EXPECT_TRUE(second->finished);
	EXPECT_FALSE(cache->finished());
}

TEST(StreamDecoderTest, DuplicateDoesNotReportFinished) {
	ChunkContent content(512);
	auto cache = cache_with(content, 256, {});
	StreamDecoder decoder(content.chunk, PieceDesc::full_stream(512, 256), cache);
	ASSERT_TRUE(decoder.push_piece_data(content.piece(0, 256)).ok());
	ASSERT_TRUE(decoder.push_piece_data(content.piece(1, 256)).ok());

	auto res = decoder.push_piece_data(content.piece(1, 256));

	ASSERT_TRUE(res.ok());
	EXPECT_TRUE(res->exists);
	EXPECT_FALSE(res->finished);
	EXPECT_TRUE(decoder.finished());
}

TEST(StreamDecoderTest, RequireIndexListsWindowGaps) {
	ChunkContent content(2560);
	auto cache = cache_with(content, 256, {0, 1, 2, 5, 6, 9});
	StreamDecoder decoder(content.chunk, PieceDesc::full_stream(2560, 256), cache);

	auto require = decoder.require_index();

	ASSERT_TRUE(require.has_value());
	EXPECT_EQ(require->next, 3);
	ASSERT_EQ(require->lost.size(), 2);
	EXPECT_EQ(require->lost[0], (IndexRange{3, 5}));
	EXPECT_EQ(require->lost[1], (IndexRange{7, 9}));
}

//---------------- Encoder ----------------//

TEST(StreamEncoderTest, SyncPathWalksWindow) {
	ChunkContent content(1000);
	auto cache = cache_with(content, 256, all_pieces(4));
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1000, 256));

	for(uint32_t index = 0; index < 4; index++) {
		uint8_t buf[1400];
		auto n = encoder->next_piece(5, buf, sizeof(buf));
		ASSERT_TRUE(n.ok());
		ASSERT_GT(*n, 0);

		auto piece = PieceData::decode(Buffer::copy_of(buf, *n));
		ASSERT_TRUE(piece.ok());
		EXPECT_EQ(piece->session_id, 5);
		EXPECT_EQ(piece->desc, PieceDesc::range(index, 256));
		auto start = index * 256;
		auto len = std::min<size_t>(256, 1000 - start);
		ASSERT_EQ(piece->data.size(), len);
		EXPECT_EQ(std::memcmp(piece->data.data(), content.bytes.data() + start, len), 0);
	}

	uint8_t buf[1400];
	auto n = encoder->next_piece(5, buf, sizeof(buf));
	ASSERT_TRUE(n.ok());
	EXPECT_EQ(*n, 0);
	EXPECT_TRUE(encoder->finished());
}

TEST(StreamEncoderTest, ReverseWindowStartsAtEnd) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4));
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256, true));

	auto piece = poll_piece(*encoder);

	ASSERT_TRUE(piece.has_value());
	EXPECT_EQ(piece->desc.index(), 3);
}

TEST(StreamEncoderTest, WaitsForMissingPiece) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, {0});
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	uint8_t buf[1400];

	ASSERT_GT(*encoder->next_piece(1, buf, sizeof(buf)), 0);
	auto n = encoder->next_piece(1, buf, sizeof(buf));

	ASSERT_TRUE(n.ok());
	EXPECT_EQ(*n, 0);
	EXPECT_EQ(encoder->remaining(), 3);

	ASSERT_TRUE(cache->push_piece_data(content.piece(1, 256)).ok());
	auto piece = poll_piece(*encoder);
	ASSERT_TRUE(piece.has_value());
	EXPECT_EQ(piece->desc.index(), 1);
}

TEST(StreamEncoderTest, ShortBufferIsInvalidInput) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4));
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	uint8_t buf[100];

	auto n = encoder->next_piece(1, buf, sizeof(buf));

	EXPECT_EQ(error_code(n), ErrorCode::InvalidInput);
	EXPECT_EQ(encoder->remaining(), 4);
}

TEST(StreamEncoderTest, AsyncOnlyStorageGoesThroughPending) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4), true);
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	uint8_t buf[1400];

	auto first = encoder->next_piece(1, buf, sizeof(buf));
	ASSERT_TRUE(first.ok());
	EXPECT_EQ(*first, 0);
	EXPECT_FALSE(encoder->finished());

	// Still pending until the loop runs
	auto second = encoder->next_piece(1, buf, sizeof(buf));
	ASSERT_TRUE(second.ok());
	EXPECT_EQ(*second, 0);

	EventLoop::run();
	auto third = encoder->next_piece(1, buf, sizeof(buf));
	ASSERT_TRUE(third.ok());
	ASSERT_GT(*third, 0);

	auto piece = PieceData::decode(Buffer::copy_of(buf, *third));
	ASSERT_TRUE(piece.ok());
	EXPECT_EQ(piece->desc.index(), 0);
	EXPECT_EQ(std::memcmp(piece->data.data(), content.bytes.data(), 256), 0);
}

TEST(StreamEncoderTest, MergeRewindsFinishedWindow) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4));
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	while(poll_piece(*encoder, 1)) {}
	ASSERT_TRUE(encoder->finished());

	encoder->merge(3, {});

	EXPECT_FALSE(encoder->finished());
	EXPECT_EQ(encoder->remaining(), 4);
	auto piece = poll_piece(*encoder);
	ASSERT_TRUE(piece.has_value());
	EXPECT_EQ(piece->desc.index(), 0);
}

TEST(StreamEncoderTest, MergeIgnoresAckedRanges) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4));
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	ASSERT_TRUE(poll_piece(*encoder, 1).has_value());
	ASSERT_TRUE(poll_piece(*encoder, 1).has_value());

	encoder->merge(1, {});

	EXPECT_EQ(encoder->remaining(), 4);
	std::vector<uint32_t> order;
	while(auto piece = poll_piece(*encoder, 1)) {
		order.push_back(piece->desc.index());
	}
	EXPECT_EQ(order, (std::vector<uint32_t>{0, 1, 2, 3}));
}

TEST(StreamEncoderTest, MergeAbandonsPendingRead) {
	ChunkContent content(2560);
	auto cache = cache_with(content, 256, all_pieces(10), true);
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(2560, 256));
	for(uint32_t index = 0; index < 3; index++) {
		auto piece = poll_piece(*encoder);
		ASSERT_TRUE(piece.has_value());
		ASSERT_EQ(piece->desc.index(), index);
	}
	uint8_t buf[1400];
	ASSERT_EQ(*encoder->next_piece(1, buf, sizeof(buf)), 0);

	// Piece 3 is in flight, the remote lost 1 and 2
	encoder->merge(5, {IndexRange{1, 3}});
	EventLoop::run();

	std::vector<uint32_t> order;
	while(auto piece = poll_piece(*encoder)) {
		order.push_back(piece->desc.index());
	}
	EXPECT_EQ(order, all_pieces(10));
	EXPECT_TRUE(encoder->finished());
}

TEST(StreamEncoderTest, MergeAbandonsCompletedRead) {
	ChunkContent content(2560);
	auto cache = cache_with(content, 256, all_pieces(10), true);
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(2560, 256));
	for(uint32_t index = 0; index < 3; index++) {
		ASSERT_TRUE(poll_piece(*encoder).has_value());
	}
	uint8_t buf[1400];
	ASSERT_EQ(*encoder->next_piece(1, buf, sizeof(buf)), 0);
	EventLoop::run();

	// Result of piece 3 is waiting for pickup
	encoder->merge(5, {IndexRange{1, 2}});

	auto piece = poll_piece(*encoder);
	ASSERT_TRUE(piece.has_value());
	EXPECT_EQ(piece->desc.index(), 0);
}

TEST(StreamEncoderTest, MergeKeepsReadOfHead) {
	ChunkContent content(2560);
	auto cache = cache_with(content, 256, all_pieces(10), true);
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(2560, 256));
	uint8_t buf[1400];
	ASSERT_EQ(*encoder->next_piece(1, buf, sizeof(buf)), 0);

	// Piece 0 is in flight and stays the head after the rewind
	encoder->merge(2, {});
	EventLoop::run();

	auto n = encoder->next_piece(1, buf, sizeof(buf));
	ASSERT_TRUE(n.ok());
	ASSERT_GT(*n, 0);
	auto piece = PieceData::decode(Buffer::copy_of(buf, *n));
	ASSERT_TRUE(piece.ok());
	EXPECT_EQ(piece->desc.index(), 0);
	EXPECT_EQ(encoder->remaining(), 9);
}

TEST(StreamEncoderTest, ResetRewindsAndAbandons) {
	ChunkContent content(1024);
	auto cache = cache_with(content, 256, all_pieces(4), true);
	auto encoder = StreamEncoder::create(cache, PieceDesc::full_stream(1024, 256));
	ASSERT_TRUE(poll_piece(*encoder).has_value());
	uint8_t buf[1400];
	ASSERT_EQ(*encoder->next_piece(1, buf, sizeof(buf)), 0);

	encoder->reset();
	EventLoop::run();

	EXPECT_EQ(encoder->remaining(), 4);
	auto piece = poll_piece(*encoder);
	ASSERT_TRUE(piece.has_value());
	EXPECT_EQ(piece->desc.index(), 0);
}
