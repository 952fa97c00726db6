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
 * cache.h
 * Recently used directory records keyed by resolved path.
 */

#ifndef CACHE_H
#define CACHE_H

#include <stddef.h>

namespace Pathlab {

class DirectoryRecord;

static const size_t RECORD_HASH_LENGTH = 1 << 10;

class RecordCache
{
public:
	RecordCache(size_t capacity);
	~RecordCache();

private:
	RecordCache(const RecordCache&);
	RecordCache& operator=(const RecordCache&);

public:
	DirectoryRecord* Get(const char* path);
	bool Put(const char* path, DirectoryRecord* record);
	void Clear();
	size_t Count() const { return count; }

private:
	void Unlink(DirectoryRecord* record);
	void Prelink(DirectoryRecord* record);
	void Evict(DirectoryRecord* record);

private:
	DirectoryRecord* mru_record;
	DirectoryRecord* lru_record;
	DirectoryRecord* hash_records[RECORD_HASH_LENGTH];
	size_t capacity;
	size_t count;

};

} // namespace Pathlab

#endif
