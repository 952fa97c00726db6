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
 * stream.cpp
 * Byte streams returned by accessors.
 */

#include <sys/types.h>

#include <errno.h>
#include <limits.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <pathlab/stream.h>

namespace Pathlab {

Stream::Stream()
{
}

Stream::~Stream()
{
}

ssize_t Stream::Write(const void* /*buf*/, size_t /*count*/)
{
	return errno = EBADF, -1;
}

bool Stream::Writable()
{
	return false;
}

bool Stream::Close()
{
	return true;
}

// Reads everything from the current position into a malloc'd buffer.
ssize_t Stream::ReadAll(uint8_t** data_out)
{
	size_t used = 0;
	size_t allocated = 4096;
	uint8_t* buffer = (uint8_t*) malloc(allocated);
	if ( !buffer )
		return -1;
	while ( true )
	{
		if ( used == allocated )
		{
			size_t new_allocated = 2 * allocated;
			uint8_t* new_buffer = (uint8_t*) realloc(buffer, new_allocated);
			if ( !new_buffer )
				return free(buffer), -1;
			buffer = new_buffer;
			allocated = new_allocated;
		}
		ssize_t amount = Read(buffer + used, allocated - used);
		if ( amount < 0 )
			return free(buffer), -1;
		if ( amount == 0 )
			break;
		used += amount;
	}
	*data_out = buffer;
	return (ssize_t) used;
}

BufferStream::BufferStream(bool writable)
{
	this->data = NULL;
	this->used = 0;
	this->allocated = 0;
	this->offset = 0;
	this->writable = writable;
}

BufferStream::~BufferStream()
{
	free(data);
}

void BufferStream::Adopt(uint8_t* new_data, size_t size)
{
	free(data);
	data = new_data;
	used = size;
	allocated = size;
	offset = 0;
}

// Shrinks the buffer or extends it with zeroes, keeping the offset in range.
bool BufferStream::Truncate(size_t size)
{
	if ( !Writable() )
		return errno = EBADF, false;
	if ( size <= used )
	{
		used = size;
		if ( used < offset )
			offset = used;
		return true;
	}
	size_t old_offset = offset;
	offset = used;
	static const uint8_t zeroes[4096] = { 0 };
	while ( used < size )
	{
		size_t amount = size - used;
		if ( sizeof(zeroes) < amount )
			amount = sizeof(zeroes);
		if ( Write(zeroes, amount) < 0 )
			return offset = old_offset, false;
	}
	offset = old_offset;
	return true;
}

ssize_t BufferStream::Read(void* buf, size_t count)
{
	if ( used <= offset )
		return 0;
	size_t left = used - offset;
	if ( left < count )
		count = left;
	if ( SSIZE_MAX < count )
		count = SSIZE_MAX;
	memcpy(buf, data + offset, count);
	offset += count;
	return (ssize_t) count;
}

ssize_t BufferStream::Write(const void* buf, size_t count)
{
	if ( !writable )
		return errno = EBADF, -1;
	if ( SSIZE_MAX < count )
		count = SSIZE_MAX;
	if ( allocated - offset < count )
	{
		size_t new_allocated = allocated ? allocated : 4096;
		while ( new_allocated - offset < count )
		{
			if ( SIZE_MAX / 2 < new_allocated )
				return errno = ENOMEM, -1;
			new_allocated *= 2;
		}
		uint8_t* new_data = (uint8_t*) realloc(data, new_allocated);
		if ( !new_data )
			return -1;
		data = new_data;
		allocated = new_allocated;
	}
	memcpy(data + offset, buf, count);
	offset += count;
	if ( used < offset )
		used = offset;
	return (ssize_t) count;
}

off_t BufferStream::Seek(off_t new_offset, int whence)
{
	off_t base;
	if ( whence == SEEK_SET )
		base = 0;
	else if ( whence == SEEK_CUR )
		base = (off_t) offset;
	else if ( whence == SEEK_END )
		base = (off_t) used;
	else
		return errno = EINVAL, -1;
	off_t result;
	if ( 0 < new_offset && (off_t) used - base < new_offset )
		result = (off_t) used;
	else if ( new_offset < 0 && new_offset < -base )
		result = 0;
	else
		result = base + new_offset;
	offset = (size_t) result;
	return result;
}

off_t BufferStream::Tell()
{
	return (off_t) offset;
}

off_t BufferStream::Length()
{
	return (off_t) used;
}

bool BufferStream::Writable()
{
	return writable;
}

} // namespace Pathlab
