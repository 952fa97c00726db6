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
 * cache.cpp
 * Recently used directory records keyed by resolved path.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

#include <pathlab/path.h>

#include "cache.h"
#include "record.h"

namespace Pathlab {

RecordCache::RecordCache(size_t capacity)
{
	this->mru_record = NULL;
	this->lru_record = NULL;
	for ( size_t i = 0; i < RECORD_HASH_LENGTH; i++ )
		this->hash_records[i] = NULL;
	this->capacity = capacity;
	this->count = 0;
}

RecordCache::~RecordCache()
{
	Clear();
}

void RecordCache::Clear()
{
	while ( mru_record )
		Evict(mru_record);
}

DirectoryRecord* RecordCache::Get(const char* path)
{
	if ( !capacity )
		return NULL;
	size_t hash = HashPath(path);
	size_t bin = hash % RECORD_HASH_LENGTH;
	for ( DirectoryRecord* iter = hash_records[bin]; iter;
	      iter = iter->next_hashed )
	{
		if ( iter->cache_hash != hash || strcmp(iter->cache_key, path) != 0 )
			continue;
		Unlink(iter);
		Prelink(iter);
		iter->Refer();
		return iter;
	}
	return NULL;
}

bool RecordCache::Put(const char* path, DirectoryRecord* record)
{
	if ( !capacity || record->cache_key )
		return false;
	if ( DirectoryRecord* existing = Get(path) )
	{
		existing->Unref();
		Evict(existing);
	}
	char* key = strdup(path);
	if ( !key )
		return false;
	while ( capacity <= count && lru_record )
		Evict(lru_record);
	record->cache_key = key;
	record->cache_hash = HashPath(path);
	record->Refer();
	Prelink(record);
	count++;
	return true;
}

void RecordCache::Evict(DirectoryRecord* record)
{
	Unlink(record);
	free(record->cache_key);
	record->cache_key = NULL;
	count--;
	record->Unref();
}

void RecordCache::Unlink(DirectoryRecord* record)
{
	(record->prev_cached ? record->prev_cached->next_cached : mru_record) = record->next_cached;
	(record->next_cached ? record->next_cached->prev_cached : lru_record) = record->prev_cached;
	size_t bin = record->cache_hash % RECORD_HASH_LENGTH;
	(record->prev_hashed ? record->prev_hashed->next_hashed : hash_records[bin]) = record->next_hashed;
	if ( record->next_hashed ) record->next_hashed->prev_hashed = record->prev_hashed;
	record->prev_cached = NULL;
	record->next_cached = NULL;
	record->prev_hashed = NULL;
	record->next_hashed = NULL;
}

void RecordCache::Prelink(DirectoryRecord* record)
{
	record->prev_cached = NULL;
	record->next_cached = mru_record;
	if ( mru_record )
		mru_record->prev_cached = record;
	mru_record = record;
	if ( !lru_record )
		lru_record = record;
	size_t bin = record->cache_hash % RECORD_HASH_LENGTH;
	record->prev_hashed = NULL;
	record->next_hashed = hash_records[bin];
	hash_records[bin] = record;
	if ( record->next_hashed )
		record->next_hashed->prev_hashed = record;
}

} // namespace Pathlab
