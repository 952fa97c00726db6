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
 * record.h
 * Decoded ISO 9660 directory records.
 */

#ifndef RECORD_H
#define RECORD_H

#include <stddef.h>
#include <stdint.h>

#include <pathlab/stat.h>

namespace Pathlab {

class MemoryMap;

struct Volume
{
	MemoryMap* map;
	uint64_t device_id;
	bool susp_enabled;
	uint8_t susp_offset;
	bool no_rock;
	bool no_susp;
};

class DirectoryRecord
{
public:
	DirectoryRecord();
	~DirectoryRecord();

private:
	DirectoryRecord(const DirectoryRecord&);
	DirectoryRecord& operator=(const DirectoryRecord&);

public:
	DirectoryRecord* prev_cached;
	DirectoryRecord* next_cached;
	DirectoryRecord* prev_hashed;
	DirectoryRecord* next_hashed;
	char* cache_key;
	size_t cache_hash;
	size_t reference_count;
	char* name;
	uint64_t record_offset;
	uint32_t sector;
	uint64_t size;
	uint32_t relocated_sector;
	bool relocated;
	bool hidden;
	bool children;
	bool is_dot;
	bool is_dotdot;
	bool has_signature;
	uint8_t susp_skip;
	StatRecord stat;

public:
	void Refer();
	void Unref();

};

// Decodes the record at the absolute image offset, which must lie within
// available bytes. The root record is the "." entry of the root directory,
// where the System Use Sharing Protocol signature is looked for.
bool DecodeRecord(const Volume* volume, uint64_t record_offset,
                  size_t available, bool is_root, DirectoryRecord* record);

bool ReadDualEndian32(const uint8_t* field, uint32_t* value_out);

} // namespace Pathlab

#endif
