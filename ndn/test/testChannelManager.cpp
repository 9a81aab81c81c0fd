#include "gtest/gtest.h"
#include "MockRawCache.hpp"
#include "MockTunnel.hpp"
#include "chunkflow/ndn/download/ChunkTask.hpp"
#include "chunkflow/ndn/download/DownloadContext.hpp"

using namespace chunkflow::core;
using namespace chunkflow::ndn;

static std::shared_ptr<DownloadContext> context_of(std::vector<PeerDesc> peers) {
	return std::make_shared<SingleDownloadContext>(std::move(peers));
}

static std::shared_ptr<ChunkStreamCache> empty_cache(ChunkId const& chunk, uint16_t piece_size = 1024) {
	auto cache = ChunkStreamCache::create(chunk, piece_size);
	EXPECT_TRUE(cache->load(false, std::make_unique<MemRawCache>(chunk.len())).ok());
	return cache;
}

static std::vector<uint8_t> read_all(std::shared_ptr<ChunkStreamCache> const& cache) {
	std::vector<uint8_t> out(cache->chunk().len());
	auto res = cache->sync_try_read(
		PieceDesc::full_stream(cache->chunk().len(), cache->piece_size()),
		out.data(),
		out.size()
	);
	EXPECT_TRUE(res.ok());
	return out;
}

//---------------- Registry ----------------//

TEST(ChannelManagerTest, CreateChannelIsIdempotent) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");

	auto first = a.channels.create_channel(b.desc());
	auto second = a.channels.create_channel(b.desc());

	EXPECT_EQ(first, second);
	EXPECT_EQ(a.channels.channel_count(), 1);
	EXPECT_EQ(a.channels.channel_of(b.id), first);
	EXPECT_EQ(a.channels.channel_of(DeviceId::from_name("nobody")), nullptr);
}

TEST(ChannelManagerTest, InboundDatagramCreatesChannel) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(2048);
	auto channel = b.channels.create_channel(a.desc());

	channel->download(content.chunk, PieceDesc::full_stream(2048, 1024), empty_cache(content.chunk));
	network.pump();

	ASSERT_NE(a.channels.channel_of(b.id), nullptr);
	EXPECT_EQ(a.tunnel.sent_count(CommandCode::RespInterest), 1);
}

TEST(ChannelManagerTest, MalformedDatagramIsDropped) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	uint8_t garbage[] = {0x7f, 1, 2, 3};

	b.tunnel.inbox.push_back(Datagram{a.id, Buffer::copy_of(garbage, sizeof(garbage))});
	b.tunnel.inbox.push_back(Datagram{a.id, Buffer::copy_of(garbage, 1)});
	network.pump();

	EXPECT_EQ(b.channels.channel_count(), 0);
	EXPECT_TRUE(b.tunnel.armed());
}

TEST(ChannelManagerTest, UnknownSendersNeedInterest) {
	MockNetwork network;
	MockNode b(network, "b");
	ChunkContent content(1024);
	uint8_t garbage[] = {0x7f, 1, 2, 3};
	uint8_t short_interest[] = {0x10, 0, 0, 0, 1};
	auto cancel = PieceControl{1, content.chunk, PieceControlCommand::Cancel, 0, {}}.encode();

	for(int i = 0; i < 100; i++) {
		auto sender = DeviceId::from_name("sender" + std::to_string(i));
		b.tunnel.inbox.push_back(Datagram{sender, Buffer::copy_of(garbage, 1 + i % 4)});
		b.tunnel.inbox.push_back(Datagram{sender, Buffer::copy_of(short_interest, sizeof(short_interest))});
		b.tunnel.inbox.push_back(Datagram{sender, Buffer::copy_of(cancel.data(), cancel.size())});
	}
	network.pump();

	EXPECT_EQ(b.channels.channel_count(), 0);
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::RespInterest), 0);
	EXPECT_TRUE(b.tunnel.armed());
}

TEST(ChannelManagerTest, RetiresChannelWithoutSessions) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(2048);
	b.channels.create_channel(a.desc())->download(content.chunk, PieceDesc::full_stream(2048, 1024), empty_cache(content.chunk));
	network.pump();
	ASSERT_EQ(a.channels.channel_count(), 1);

	a.channels.on_time_escape(0);
	a.channels.on_time_escape(59999);
	EXPECT_EQ(a.channels.channel_count(), 1);
	a.channels.on_time_escape(60000);

	EXPECT_EQ(a.channels.channel_count(), 0);
	EXPECT_EQ(a.channels.channel_of(b.id), nullptr);
}

TEST(ChannelManagerTest, KeepsChannelWhileSessionLives) {
	MockNetwork network;
	MockNode a(network, "a");
	ChunkContent content(2048);
	auto channel = a.channels.create_channel(PeerDesc{DeviceId::from_name("gone"), SocketAddress()});
	channel->download(content.chunk, PieceDesc::full_stream(2048, 1024), empty_cache(content.chunk));

	a.channels.on_time_escape(0);
	a.channels.on_time_escape(9999);
	EXPECT_EQ(a.channels.channel_count(), 1);

	// Session times out here, the idle period starts
	a.channels.on_time_escape(10000);
	a.channels.on_time_escape(69999);
	EXPECT_EQ(a.channels.channel_count(), 1);
	a.channels.on_time_escape(70000);

	EXPECT_EQ(a.channels.channel_count(), 0);
}

TEST(ChannelManagerTest, RecvErrorRearms) {
	MockNetwork network;
	MockNode a(network, "a");

	a.tunnel.fail_recv();

	EXPECT_TRUE(a.tunnel.armed());
}

TEST(ChannelManagerTest, StopEndsReceiveLoop) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(1024);

	b.channels.stop();
	a.channels.create_channel(b.desc())->download(content.chunk, PieceDesc::full_stream(1024, 1024), empty_cache(content.chunk));
	network.pump();

	EXPECT_FALSE(b.tunnel.armed());
	EXPECT_EQ(b.channels.channel_count(), 0);
}

//---------------- Transfer ----------------//

TEST(ChannelManagerTest, TransfersChunk) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(5000);
	ASSERT_TRUE(a.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	ASSERT_TRUE(task.ok());

	b.chunks.on_schedule(0);
	network.pump();
	a.channels.on_time_escape(10);
	network.pump();

	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Finished);
	EXPECT_EQ(a.tunnel.sent_count(CommandCode::PieceData), 5);
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::PieceControl), 1);
	EXPECT_EQ(a.channels.channel_of(b.id)->upload_session_count(), 0);
	EXPECT_EQ(b.channels.channel_of(a.id)->download_session_count(), 0);
	EXPECT_EQ(read_all(b.chunks.cache_of(content.chunk)->stream()), content.bytes);
}

TEST(ChannelManagerTest, ResendsLostPieces) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(5000);
	ASSERT_TRUE(a.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	int pieces_sent = 0;
	a.tunnel.drop = [&](DeviceId const&, Buffer const& payload) {
		return command_of(payload) == CommandCode::PieceData && ++pieces_sent == 4;
	};
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	ASSERT_TRUE(task.ok());

	b.chunks.on_schedule(0);
	network.pump();
	a.channels.on_time_escape(0);
	network.pump();
	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Downloading);

	// Piece 3 was lost, the next request asks for more
	b.channels.on_time_escape(0);
	b.channels.on_time_escape(600);
	network.pump();
	a.channels.on_time_escape(600);
	network.pump();

	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Finished);
	// The Continue rewinds the whole window
	EXPECT_EQ(a.tunnel.sent_count(CommandCode::PieceData), 10);
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::PieceControl), 2);
	EXPECT_EQ(read_all(b.chunks.cache_of(content.chunk)->stream()), content.bytes);
}

TEST(ChannelManagerTest, ResendsLostInterest) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(3000);
	ASSERT_TRUE(a.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	int interests = 0;
	b.tunnel.drop = [&](DeviceId const&, Buffer const& payload) {
		return command_of(payload) == CommandCode::Interest && ++interests == 1;
	};
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	ASSERT_TRUE(task.ok());

	b.chunks.on_schedule(0);
	network.pump();
	b.channels.on_time_escape(0);
	b.channels.on_time_escape(200);
	EXPECT_EQ(b.tunnel.sent_count(CommandCode::Interest), 1);

	b.channels.on_time_escape(500);
	network.pump();
	a.channels.on_time_escape(500);
	network.pump();

	EXPECT_EQ(b.tunnel.sent_count(CommandCode::Interest), 2);
	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Finished);
}

TEST(ChannelManagerTest, UnknownChunkIsRefused) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	ChunkContent content(2048);
	auto channel = b.channels.create_channel(a.desc());

	auto session = channel->download(content.chunk, PieceDesc::full_stream(2048, 1024), empty_cache(content.chunk));
	network.pump();

	EXPECT_EQ(session->state(), DownloadSession::State::Error);
	EXPECT_EQ(error_code(session->error()), ErrorCode::NotFound);
	EXPECT_EQ(channel->download_session_count(), 0);
}

TEST(ChannelManagerTest, SilentSessionTimesOut) {
	MockNetwork network;
	MockNode a(network, "a");
	ChunkContent content(2048);
	auto channel = a.channels.create_channel(PeerDesc{DeviceId::from_name("gone"), SocketAddress()});
	auto session = channel->download(content.chunk, PieceDesc::full_stream(2048, 1024), empty_cache(content.chunk));

	channel->on_time_escape(0);
	channel->on_time_escape(5000);
	EXPECT_EQ(session->state(), DownloadSession::State::Downloading);
	channel->on_time_escape(10000);

	EXPECT_EQ(session->state(), DownloadSession::State::Error);
	EXPECT_EQ(error_code(session->error()), ErrorCode::Timeout);
	EXPECT_EQ(channel->download_session_count(), 0);
	EXPECT_EQ(a.tunnel.sent_count(CommandCode::PieceControl), 1);
}

TEST(ChannelManagerTest, DownloaderMovesToNextSource) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	MockNode c(network, "c");
	ChunkContent content(4096);
	ASSERT_TRUE(c.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({a.desc(), c.desc()}));
	ASSERT_TRUE(task.ok());
	auto downloader = b.chunks.cache_of(content.chunk)->downloader();

	b.chunks.on_schedule(0);
	network.pump();
	EXPECT_EQ(a.tunnel.sent_count(CommandCode::RespInterest), 1);

	b.chunks.on_schedule(1000);
	network.pump();
	c.channels.on_time_escape(1000);
	network.pump();

	EXPECT_EQ((*task)->state().type, DownloadTaskState::Type::Finished);
	EXPECT_EQ(c.tunnel.sent_count(CommandCode::PieceData), 4);

	b.chunks.on_schedule(2000);
	EXPECT_FALSE(downloader->has_session());
	EXPECT_EQ(downloader->downloaded(), 4096);
}

//---------------- Speed ----------------//

TEST(ChannelManagerTest, AggregatesSpeed) {
	MockNetwork network;
	MockNode a(network, "a");
	MockNode b(network, "b");
	MockNode c(network, "c");
	ChunkContent content(8192);
	ASSERT_TRUE(a.chunks.store_chunk(content.chunk, content.bytes.data(), content.bytes.size()).ok());
	auto task = ChunkTask::create(b.chunks, content.chunk, context_of({a.desc()}));
	ASSERT_TRUE(task.ok());
	b.chunks.on_schedule(0);
	network.pump();
	a.channels.on_schedule(0);
	b.channels.on_schedule(0);

	a.channels.on_time_escape(0);
	network.pump();
	a.channels.on_schedule(1000);
	b.channels.on_schedule(1000);

	EXPECT_EQ(b.channels.cur_download_speed(), 8192);
	EXPECT_EQ(b.channels.history_download_speed(), 4096);
	EXPECT_EQ(a.channels.cur_upload_speed(), 8192);
	EXPECT_EQ(a.channels.history_upload_speed(), 4096);
	EXPECT_EQ(b.channels.channel_of(a.id)->cur_download_speed(), 8192);

	// Idle interval decays the history
	b.channels.on_schedule(2000);
	EXPECT_EQ(b.channels.cur_download_speed(), 0);
	EXPECT_EQ(b.channels.history_download_speed(), 2048);

	auto fresh = b.channels.create_channel(c.desc());
	EXPECT_EQ(fresh->history_download_speed(), 1024);
}

//---------------- PeerTable ----------------//

TEST(PeerTableTest, ParsePeer) {
	auto peer = PeerTable::parse_peer("alice@127.0.0.1:9000");

	ASSERT_TRUE(peer.has_value());
	EXPECT_EQ(peer->id, DeviceId::from_name("alice"));
	EXPECT_EQ(peer->endpoint, *SocketAddress::from_string("127.0.0.1:9000"));
}

TEST(PeerTableTest, ParsePeerRejectsMalformed) {
	EXPECT_FALSE(PeerTable::parse_peer("127.0.0.1:9000").has_value());
	EXPECT_FALSE(PeerTable::parse_peer("@127.0.0.1:9000").has_value());
	EXPECT_FALSE(PeerTable::parse_peer("alice@nowhere").has_value());
}

TEST(PeerTableTest, AddAndRemove) {
	PeerTable table;
	auto alice = *PeerTable::parse_peer("alice@127.0.0.1:9000");
	auto moved = *PeerTable::parse_peer("alice@127.0.0.1:9001");

	table.add(alice);
	table.add(moved);

	EXPECT_EQ(table.size(), 1);
	ASSERT_TRUE(table.peer_of(alice.id).has_value());
	EXPECT_EQ(table.peer_of(alice.id)->endpoint, moved.endpoint);

	table.remove(alice.id);
	EXPECT_FALSE(table.peer_of(alice.id).has_value());
	EXPECT_TRUE(table.all().empty());
}

//---------------- DownloadContextSet ----------------//

TEST(DownloadContextSetTest, AddRemove) {
	DownloadContextSet set;

	auto first = set.add_context(context_of({}));
	auto second = set.add_context(context_of({}));

	EXPECT_EQ(first, 1);
	EXPECT_EQ(second, 2);
	EXPECT_EQ(set.size(), 2);
	EXPECT_TRUE(set.remove_context(first));
	EXPECT_FALSE(set.remove_context(first));
	EXPECT_EQ(set.size(), 1);
	EXPECT_FALSE(set.empty());
}

TEST(DownloadContextSetTest, SourcesAreDeduplicated) {
	DownloadContextSet set;
	PeerDesc a{DeviceId::from_name("a"), SocketAddress()};
	PeerDesc b{DeviceId::from_name("b"), SocketAddress()};
	PeerDesc c{DeviceId::from_name("c"), SocketAddress()};
	ChunkContent content(16);
	set.add_context(context_of({a, b}));
	set.add_context(context_of({b, c}));

	auto sources = set.sources(content.chunk);

	ASSERT_EQ(sources.size(), 3);
	EXPECT_EQ(sources[0].id, a.id);
	EXPECT_EQ(sources[1].id, b.id);
	EXPECT_EQ(sources[2].id, c.id);
}
