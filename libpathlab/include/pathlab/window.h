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
 * pathlab/window.h
 * Read-only windows into a shared memory mapping of a file.
 */

#ifndef INCLUDE_PATHLAB_WINDOW_H
#define INCLUDE_PATHLAB_WINDOW_H

#include <sys/types.h>

#include <stddef.h>
#include <stdint.h>

#include <pathlab/stream.h>

namespace Pathlab {

class MemoryMap
{
public:
	static MemoryMap* Open(const char* path);

private:
	MemoryMap(uint8_t* data, size_t size);
	~MemoryMap();

public:
	void Refer();
	void Unref();
	const uint8_t* Data() const { return data; }
	uint64_t Size() const { return size; }

public:
	size_t reference_count;

private:
	uint8_t* data;
	size_t size;

};

class MemoryWindowStream : public Stream
{
public:
	static MemoryWindowStream* Create(MemoryMap* map, uint64_t offset,
	                                  uint64_t length);

private:
	MemoryWindowStream(MemoryMap* map, uint64_t offset, uint64_t length);

public:
	virtual ~MemoryWindowStream();

public:
	virtual ssize_t Read(void* buf, size_t count);
	virtual off_t Seek(off_t offset, int whence);
	virtual off_t Tell();
	virtual off_t Length();
	virtual bool Writable();

public:
	MemoryWindowStream* Derive(uint64_t local_offset, uint64_t length);
	size_t ReadView(const uint8_t** data_out, size_t count);
	size_t ReadRest(const uint8_t** data_out);
	size_t Peek(const uint8_t** data_out, size_t count);
	const uint8_t* Buffer() const { return map->Data() + offset; }
	uint64_t Offset() const { return offset; }
	MemoryMap* Map() const { return map; }

private:
	MemoryMap* map;
	uint64_t offset;
	uint64_t length;
	uint64_t cursor;

};

} // namespace Pathlab

#endif
