// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Util.hxx"
#include "gelf/Chunker.hxx"
#include "gelf/Error.hxx"

#include <gtest/gtest.h>

#include <string>

TEST(GelfChunker, Sizes)
{
	static_assert(Gelf::CHUNK_HEADER_SIZE == 12);
	static_assert(Gelf::GetChunkPayloadSize(1400) == 1388);
	static_assert(Gelf::GetMaxMessageSize(1400) == 1388 * 128);
	static_assert(Gelf::GetMaxMessageSize(100) == 11264);
}

TEST(GelfChunker, Count)
{
	EXPECT_EQ(Gelf::ChunkCount(0, 1400), 1u);
	EXPECT_EQ(Gelf::ChunkCount(1400, 1400), 1u);
	EXPECT_EQ(Gelf::ChunkCount(1401, 1400), 2u);
	EXPECT_EQ(Gelf::ChunkCount(2 * 1388, 1400), 2u);
	EXPECT_EQ(Gelf::ChunkCount(2 * 1388 + 1, 1400), 3u);
	EXPECT_EQ(Gelf::ChunkCount(128 * 1388, 1400), 128u);

	EXPECT_THROW(Gelf::ChunkCount(128 * 1388 + 1, 1400),
		     Gelf::SizeExceededError);

	try {
		Gelf::ChunkCount(20000, 100);
		FAIL();
	} catch (const Gelf::SizeExceededError &e) {
		EXPECT_STREQ(e.what(), "Cannot log messages bigger than 11264 bytes");
	}
}

TEST(GelfChunker, MessageId)
{
	const auto a = Gelf::GenerateMessageId();
	const auto b = Gelf::GenerateMessageId();

	/* 64 random bits; a collision is practically impossible */
	EXPECT_NE(a, b);
}

TEST(GelfChunker, Build)
{
	const std::string payload(250, 'x');
	const Gelf::MessageId id{
		std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4},
		std::byte{5}, std::byte{6}, std::byte{7}, std::byte{8},
	};

	/* 88 payload bytes per chunk */
	Gelf::Chunker chunker{std::as_bytes(std::span{payload}), 100, id};
	ASSERT_EQ(chunker.size(), 3u);

	std::string reassembled;
	for (std::size_t i = 0; i < chunker.size(); ++i) {
		const auto chunk = chunker.Build(i);
		ASSERT_GT(chunk.size(), Gelf::CHUNK_HEADER_SIZE);
		EXPECT_LE(chunk.size(), 100u);

		EXPECT_EQ(chunk[0], std::byte{0x1e});
		EXPECT_EQ(chunk[1], std::byte{0x0f});
		for (std::size_t j = 0; j < id.size(); ++j)
			EXPECT_EQ(chunk[2 + j], id[j]);
		EXPECT_EQ(chunk[10], std::byte(i));
		EXPECT_EQ(chunk[11], std::byte{3});

		reassembled.append(ToStringView(chunk.subspan(Gelf::CHUNK_HEADER_SIZE)));
	}

	EXPECT_EQ(chunker.Build(0).size(), 100u);
	EXPECT_EQ(chunker.Build(2).size(), 12u + 250u - 2 * 88u);

	EXPECT_EQ(reassembled, payload);
}
