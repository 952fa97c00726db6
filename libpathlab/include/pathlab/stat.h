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
 * pathlab/stat.h
 * Unified file metadata.
 */

#ifndef INCLUDE_PATHLAB_STAT_H
#define INCLUDE_PATHLAB_STAT_H

#include <stddef.h>
#include <stdint.h>
#include <time.h>

namespace Pathlab {

enum FileType
{
	FILE_TYPE_FILE,
	FILE_TYPE_DIR,
	FILE_TYPE_SYMLINK,
	FILE_TYPE_SOCKET,
	FILE_TYPE_FIFO,
	FILE_TYPE_CHAR_DEVICE,
	FILE_TYPE_BLOCK_DEVICE,
	FILE_TYPE_LINK,
};

#define PATHLAB_S_IFMT (0170000)
#define PATHLAB_S_IFIFO (0010000)
#define PATHLAB_S_IFCHR (0020000)
#define PATHLAB_S_IFDIR (0040000)
#define PATHLAB_S_IFBLK (0060000)
#define PATHLAB_S_IFREG (0100000)
#define PATHLAB_S_IFLNK (0120000)
#define PATHLAB_S_IFSOCK (0140000)
#define PATHLAB_S_IPERM (07777)

static const size_t STAT_NAME_MAX = 32;

class StatRecord
{
public:
	StatRecord();
	~StatRecord();

private:
	StatRecord(const StatRecord&);
	StatRecord& operator=(const StatRecord&);

public:
	int type;
	uint64_t size;
	uint32_t permissions;
	char user[STAT_NAME_MAX + 1];
	char group[STAT_NAME_MAX + 1];
	uint32_t user_id;
	uint32_t group_id;
	uint64_t device_id;
	uint64_t file_id;
	uint32_t hard_link_count;
	struct timespec create_time;
	struct timespec access_time;
	struct timespec modify_time;
	struct timespec status_time;
	char* target; // Symbolic link target, or NULL.

public:
	uint32_t Mode() const;
	bool CopyFrom(const StatRecord* other);
	bool SetTarget(const char* new_target);
	void SetUser(const char* name);
	void SetGroup(const char* name);
	void Reset();
	int Compare(const StatRecord* other) const;
	bool operator==(const StatRecord& other) const { return !Compare(&other); }
	bool operator!=(const StatRecord& other) const { return Compare(&other); }
	bool operator<(const StatRecord& other) const { return Compare(&other) < 0; }

};

uint32_t PackMode(int type, uint32_t permissions);
void UnpackMode(uint32_t mode, int* type_out, uint32_t* permissions_out);
const char* FileTypeName(int type);

} // namespace Pathlab

#endif
