// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Deflate.hxx"
#include "Error.hxx"

#include <zlib.h>

namespace {

class DeflateStream {
	z_stream z{};

public:
	DeflateStream() {
		if (int err = deflateInit(&z, Z_DEFAULT_COMPRESSION); err != Z_OK)
			throw MakeZlibError(err, "deflateInit() failed");
	}

	~DeflateStream() noexcept {
		deflateEnd(&z);
	}

	DeflateStream(const DeflateStream &) = delete;
	DeflateStream &operator=(const DeflateStream &) = delete;

	z_stream *operator->() noexcept {
		return &z;
	}

	z_stream *get() noexcept {
		return &z;
	}
};

} // anonymous namespace

std::vector<std::byte>
Deflate(std::span<const std::byte> src)
{
	DeflateStream z;

	std::vector<std::byte> dest(deflateBound(z.get(), src.size()));

	z->next_in = reinterpret_cast<Bytef *>(const_cast<std::byte *>(src.data()));
	z->avail_in = static_cast<uInt>(src.size());

	z->next_out = reinterpret_cast<Bytef *>(dest.data());
	z->avail_out = static_cast<uInt>(dest.size());

	/* deflateBound() guarantees that one call is enough */
	if (int err = deflate(z.get(), Z_FINISH); err != Z_STREAM_END)
		throw MakeZlibError(err, "deflate() failed");

	dest.resize(dest.size() - static_cast<std::size_t>(z->avail_out));
	return dest;
}
