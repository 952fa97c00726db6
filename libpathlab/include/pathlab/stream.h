/*
 * Copyright (c) 2026 Jonas 'Sortie' Termansen.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 *
 * pathlab/stream.h
 * Byte streams returned by accessors.
 */

#ifndef INCLUDE_PATHLAB_STREAM_H
#define INCLUDE_PATHLAB_STREAM_H

#include <sys/types.h>

#include <stddef.h>
#include <stdint.h>

namespace Pathlab {

class Stream
{
public:
	Stream();
	virtual ~Stream();

private:
	Stream(const Stream&);
	Stream& operator=(const Stream&);

public:
	virtual ssize_t Read(void* buf, size_t count) = 0;
	virtual ssize_t Write(const void* buf, size_t count);
	virtual off_t Seek(off_t offset, int whence) = 0;
	virtual off_t Tell() = 0;
	virtual off_t Length() = 0;
	virtual bool Writable();
	virtual bool Close();

public:
	ssize_t ReadAll(uint8_t** data_out);

};

class BufferStream : public Stream
{
public:
	BufferStream(bool writable);
	virtual ~BufferStream();

public:
	virtual ssize_t Read(void* buf, size_t count);
	virtual ssize_t Write(const void* buf, size_t count);
	virtual off_t Seek(off_t offset, int whence);
	virtual off_t Tell();
	virtual off_t Length();
	virtual bool Writable();

public:
	void Adopt(uint8_t* new_data, size_t size);
	bool Truncate(size_t size);
	const uint8_t* Data() const { return data; }
	size_t Size() const { return used; }

protected:
	uint8_t* data;
	size_t used;
	size_t allocated;
	size_t offset;
	bool writable;

};

} // namespace Pathlab

#endif
