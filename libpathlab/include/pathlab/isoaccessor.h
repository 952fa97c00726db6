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
 * pathlab/isoaccessor.h
 * Read-only accessor for ISO 9660 images with Rock Ridge extensions.
 */

#ifndef INCLUDE_PATHLAB_ISOACCESSOR_H
#define INCLUDE_PATHLAB_ISOACCESSOR_H

#include <stddef.h>
#include <stdint.h>

#include <pathlab/accessor.h>

namespace Pathlab {

class DirectoryRecord;
class MemoryMap;
class RecordCache;
struct Volume;

static const size_t ISO_DEFAULT_CACHE_SIZE = 1024;

struct IsoOptions
{
	IsoOptions() : cache_size(ISO_DEFAULT_CACHE_SIZE), no_rock(false),
	               no_susp(false) { }
	size_t cache_size; // Cached directory records, 0 disables the cache.
	bool no_rock;
	bool no_susp;
};

class Iso9660Accessor : public Accessor
{
public:
	static Iso9660Accessor* Mount(const char* image_path,
	                              const IsoOptions* options = NULL);

private:
	Iso9660Accessor(MemoryMap* map, const IsoOptions* options);

public:
	virtual ~Iso9660Accessor();

public:
	virtual Stream* Open(const char* path, int mode, int buffering = -1);
	virtual char** ListDir(const char* path, size_t* count_out);

public:
	size_t CachedRecords() const;
	bool RockRidge() const;

protected:
	virtual bool Lookup(const char* resolved_path, StatRecord* st);

private:
	bool LoadVolume(const char* image_path);
	DirectoryRecord* GetRecord(const char* resolved_path);
	DirectoryRecord* FindChild(DirectoryRecord* dir, const char* name);
	bool NextChild(DirectoryRecord* dir, uint64_t* offset_inout,
	               DirectoryRecord** child_out);

private:
	MemoryMap* map;
	Volume* volume;
	RecordCache* cache;
	DirectoryRecord* root;

};

} // namespace Pathlab

#endif
