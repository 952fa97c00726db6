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
 * window.cpp
 * Read-only windows into a shared memory mapping of a file.
 */

#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <assert.h>
#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include <pathlab/window.h>

namespace Pathlab {

MemoryMap* MemoryMap::Open(const char* path)
{
	int fd = open(path, O_RDONLY);
	if ( fd < 0 )
		return (MemoryMap*) NULL;
	struct stat st;
	if ( fstat(fd, &st) < 0 )
		return close(fd), (MemoryMap*) NULL;
	if ( S_ISDIR(st.st_mode) )
		return close(fd), errno = EISDIR, (MemoryMap*) NULL;
	if ( st.st_size < 0 || (uintmax_t) SIZE_MAX < (uintmax_t) st.st_size )
		return close(fd), errno = EFBIG, (MemoryMap*) NULL;
	size_t size = (size_t) st.st_size;
	uint8_t* data = NULL;
	// mmap refuses empty mappings, an empty file is an empty window.
	if ( size )
	{
		void* mapping = mmap(NULL, size, PROT_READ, MAP_PRIVATE, fd, 0);
		if ( mapping == MAP_FAILED )
			return close(fd), (MemoryMap*) NULL;
		data = (uint8_t*) mapping;
	}
	close(fd);
	MemoryMap* map = new MemoryMap(data, size);
	return map;
}

MemoryMap::MemoryMap(uint8_t* data, size_t size)
{
	this->reference_count = 1;
	this->data = data;
	this->size = size;
}

MemoryMap::~MemoryMap()
{
	if ( data )
		munmap(data, size);
}

void MemoryMap::Refer()
{
	reference_count++;
}

void MemoryMap::Unref()
{
	assert(0 < reference_count);
	if ( !--reference_count )
		delete this;
}

MemoryWindowStream* MemoryWindowStream::Create(MemoryMap* map,
                                               uint64_t offset,
                                               uint64_t length)
{
	if ( map->Size() < offset || map->Size() - offset < length )
		return errno = EINVAL, (MemoryWindowStream*) NULL;
	return new MemoryWindowStream(map, offset, length);
}

MemoryWindowStream::MemoryWindowStream(MemoryMap* map, uint64_t offset,
                                       uint64_t length)
{
	map->Refer();
	this->map = map;
	this->offset = offset;
	this->length = length;
	this->cursor = 0;
}

MemoryWindowStream::~MemoryWindowStream()
{
	map->Unref();
}

MemoryWindowStream* MemoryWindowStream::Derive(uint64_t local_offset,
                                               uint64_t sub_length)
{
	if ( length < local_offset || length - local_offset < sub_length )
		return errno = EINVAL, (MemoryWindowStream*) NULL;
	return new MemoryWindowStream(map, offset + local_offset, sub_length);
}

size_t MemoryWindowStream::Peek(const uint8_t** data_out, size_t count)
{
	uint64_t left = length - cursor;
	if ( left < count )
		count = (size_t) left;
	*data_out = map->Data() ? map->Data() + offset + cursor : NULL;
	return count;
}

size_t MemoryWindowStream::ReadView(const uint8_t** data_out, size_t count)
{
	size_t amount = Peek(data_out, count);
	cursor += amount;
	return amount;
}

size_t MemoryWindowStream::ReadRest(const uint8_t** data_out)
{
	return ReadView(data_out, SIZE_MAX);
}

ssize_t MemoryWindowStream::Read(void* buf, size_t count)
{
	if ( SSIZE_MAX < count )
		count = SSIZE_MAX;
	const uint8_t* data;
	size_t amount = ReadView(&data, count);
	if ( amount )
		memcpy(buf, data, amount);
	return (ssize_t) amount;
}

off_t MemoryWindowStream::Seek(off_t new_offset, int whence)
{
	off_t base;
	if ( whence == SEEK_SET )
		base = 0;
	else if ( whence == SEEK_CUR )
		base = (off_t) cursor;
	else if ( whence == SEEK_END )
		base = (off_t) length;
	else
		return errno = EINVAL, -1;
	off_t result;
	if ( 0 < new_offset && (off_t) length - base < new_offset )
		result = (off_t) length;
	else if ( new_offset < 0 && new_offset < -base )
		result = 0;
	else
		result = base + new_offset;
	cursor = (uint64_t) result;
	return result;
}

off_t MemoryWindowStream::Tell()
{
	return (off_t) cursor;
}

off_t MemoryWindowStream::Length()
{
	return (off_t) length;
}

bool MemoryWindowStream::Writable()
{
	return false;
}

} // namespace Pathlab
