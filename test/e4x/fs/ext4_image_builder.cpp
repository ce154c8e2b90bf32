/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "ext4_image_builder.h"

#include "e4x/fs/e4x_ext4fs.h"

#include <cstring>
#include <fstream>
#include <stdexcept>

Ext4ImageBuilder::Ext4ImageBuilder(uint32_t block_size, uint32_t block_count)
    : m_block_size(block_size), m_block_count(block_count)
{
    m_first_data_block = (block_size == 1024) ? 1 : 0;
    m_img.assign((size_t) block_size * block_count, 0);

    uint32_t log = 0;
    while ((1024u << log) < block_size)
        log++;

    const uint32_t itable_blocks = INODES_COUNT * INODE_SIZE / block_size;
    const uint64_t gdt = m_first_data_block + 1;
    m_inode_table = gdt + 1;
    m_next_block = m_inode_table + itable_blocks + 2;
    m_next_ino = 11;

    ext4fs_sb *sb = (ext4fs_sb *) superblock();
    put32(sb->s_inodes_count, INODES_COUNT);
    put32(sb->s_blocks_count, block_count);
    put32(sb->s_first_data_block, m_first_data_block);
    put32(sb->s_log_block_size, log);
    put32(sb->s_log_cluster_size, log);
    put32(sb->s_blocks_per_group, block_count);
    put32(sb->s_clusters_per_group, block_count);
    put32(sb->s_inodes_per_group, INODES_COUNT);
    put16(sb->s_magic, EXT4FS_FS_MAGIC);
    put16(sb->s_state, EXT4FS_STATE_VALID);
    put32(sb->s_rev_level, EXT4FS_REV_DYN);
    put32(sb->s_first_ino, 11);
    put16(sb->s_inode_size, INODE_SIZE);
    put32(sb->s_feature_incompat, EXT4FS_FEATURE_INCOMPAT_FILETYPE |
        EXT4FS_FEATURE_INCOMPAT_EXTENTS);
    put32(sb->s_feature_compat, EXT4FS_FEATURE_COMPAT_EXT_ATTR);
    for (int i = 0; i < 16; i++)
        sb->s_uuid[i] = (uint8_t) (0x10 + i);
    memcpy(sb->s_volume_name, "testvol", 7);

    ext4fs_gd *gd = (ext4fs_gd *) block(gdt);
    put32(gd->bg_block_bitmap_lo, (uint32_t) (m_inode_table + itable_blocks));
    put32(gd->bg_inode_bitmap_lo,
        (uint32_t) (m_inode_table + itable_blocks + 1));
    put32(gd->bg_inode_table_lo, (uint32_t) m_inode_table);

    makeDirInode(ROOT_INO, false);
}

void
Ext4ImageBuilder::put16(uint8_t * a_p, uint16_t a_v)
{
    a_p[0] = (uint8_t) (a_v & 0xff);
    a_p[1] = (uint8_t) (a_v >> 8);
}

void
Ext4ImageBuilder::put32(uint8_t * a_p, uint32_t a_v)
{
    for (int i = 0; i < 4; i++)
        a_p[i] = (uint8_t) ((a_v >> (8 * i)) & 0xff);
}

uint32_t
Ext4ImageBuilder::incompat() const
{
    const ext4fs_sb *sb = (const ext4fs_sb *) &m_img[EXT4FS_SBOFF];
    const uint8_t *p = sb->s_feature_incompat;
    return p[0] | (p[1] << 8) | (p[2] << 16) | ((uint32_t) p[3] << 24);
}

void
Ext4ImageBuilder::setIncompat(uint32_t a_flags)
{
    put32(((ext4fs_sb *) superblock())->s_feature_incompat, a_flags);
}

void
Ext4ImageBuilder::setRoCompat(uint32_t a_flags)
{
    put32(((ext4fs_sb *) superblock())->s_feature_ro_compat, a_flags);
}

void
Ext4ImageBuilder::set64Bit(uint16_t a_desc_size)
{
    setIncompat(incompat() | EXT4FS_FEATURE_INCOMPAT_64BIT);
    put16(((ext4fs_sb *) superblock())->s_desc_size, a_desc_size);
}

uint8_t *
Ext4ImageBuilder::block(uint64_t a_blk)
{
    if (a_blk >= m_block_count)
        throw std::out_of_range("block outside the image");
    return &m_img[(size_t) a_blk * m_block_size];
}

uint8_t *
Ext4ImageBuilder::superblock()
{
    return &m_img[EXT4FS_SBOFF];
}

// the table of the only group follows the superblock
uint8_t *
Ext4ImageBuilder::groupDesc()
{
    return block(m_first_data_block + 1);
}

uint8_t *
Ext4ImageBuilder::inode(uint32_t a_ino)
{
    if (a_ino == 0 || a_ino > INODES_COUNT)
        throw std::out_of_range("inode number");
    return &m_img[(size_t) m_inode_table * m_block_size +
        (size_t) (a_ino - 1) * INODE_SIZE];
}

uint64_t
Ext4ImageBuilder::allocBlocks(uint32_t a_cnt)
{
    if (m_next_block + a_cnt > m_block_count)
        throw std::runtime_error("image is full");
    uint64_t first = m_next_block;
    m_next_block += a_cnt;
    return first;
}

void
Ext4ImageBuilder::writeData(uint64_t a_blk, const std::string & a_data)
{
    size_t nblocks = (a_data.size() + m_block_size - 1) / m_block_size;
    if (nblocks > 0)
        block(a_blk + nblocks - 1);
    memcpy(block(a_blk), a_data.data(), a_data.size());
}

uint32_t
Ext4ImageBuilder::newInode()
{
    if (m_next_ino > INODES_COUNT)
        throw std::runtime_error("out of inodes");
    return m_next_ino++;
}

void
Ext4ImageBuilder::setInode(uint32_t a_ino, uint16_t a_mode, uint64_t a_size,
    uint32_t a_flags)
{
    uint8_t *raw = inode(a_ino);
    memset(raw, 0, INODE_SIZE);
    ext4fs_inode *in = (ext4fs_inode *) raw;

    put16(in->i_mode, a_mode);
    put32(in->i_size, (uint32_t) (a_size & 0xffffffff));
    put32(in->i_size_high, (uint32_t) (a_size >> 32));
    put16(in->i_nlink, 1);
    put32(in->i_flags, a_flags);
    put16(in->i_extra_isize, EXTRA_ISIZE);
    put32(in->i_atime, 1600000000);
    put32(in->i_mtime, 1600000000);
    put32(in->i_ctime, 1600000000);
    put32(in->i_crtime, 1500000000);
}

void
Ext4ImageBuilder::setTimes(uint32_t a_ino, uint32_t a_atime,
    uint32_t a_atime_ns, uint32_t a_mtime, uint32_t a_mtime_ns)
{
    ext4fs_inode *in = (ext4fs_inode *) inode(a_ino);
    put32(in->i_atime, a_atime);
    put32(in->i_atime_extra, a_atime_ns << 2);
    put32(in->i_mtime, a_mtime);
    put32(in->i_mtime_extra, a_mtime_ns << 2);
}

void
Ext4ImageBuilder::setOwner(uint32_t a_ino, uint32_t a_uid, uint32_t a_gid)
{
    ext4fs_inode *in = (ext4fs_inode *) inode(a_ino);
    put16(in->i_uid, (uint16_t) (a_uid & 0xffff));
    put16(in->i_uid_high, (uint16_t) (a_uid >> 16));
    put16(in->i_gid, (uint16_t) (a_gid & 0xffff));
    put16(in->i_gid_high, (uint16_t) (a_gid >> 16));
}

static void
put_extent_header(uint8_t * a_p, uint16_t a_entries, uint16_t a_max,
    uint16_t a_depth)
{
    ext4fs_extent_header *hdr = (ext4fs_extent_header *) a_p;
    hdr->eh_magic[0] = EXT4_EXT_MAGIC & 0xff;
    hdr->eh_magic[1] = EXT4_EXT_MAGIC >> 8;
    hdr->eh_entries[0] = a_entries & 0xff;
    hdr->eh_entries[1] = a_entries >> 8;
    hdr->eh_max[0] = a_max & 0xff;
    hdr->eh_max[1] = a_max >> 8;
    hdr->eh_depth[0] = a_depth & 0xff;
    hdr->eh_depth[1] = a_depth >> 8;
}

static void
put_extents(uint8_t * a_p, const std::vector<Ext4ImageBuilder::Extent> & a_ext)
{
    for (size_t i = 0; i < a_ext.size(); i++) {
        uint8_t *e = a_p + sizeof(ext4fs_extent_header) +
            i * sizeof(ext4fs_extent);
        const Ext4ImageBuilder::Extent & x = a_ext[i];
        const uint16_t len = x.len + (x.uninit ? EXT4_EXT_INIT_MAX_LEN : 0);
        for (int b = 0; b < 4; b++)
            e[b] = (uint8_t) ((x.lblk >> (8 * b)) & 0xff);
        e[4] = len & 0xff;
        e[5] = len >> 8;
        e[6] = (uint8_t) ((x.pblk >> 32) & 0xff);
        e[7] = (uint8_t) ((x.pblk >> 40) & 0xff);
        for (int b = 0; b < 4; b++)
            e[8 + b] = (uint8_t) ((x.pblk >> (8 * b)) & 0xff);
    }
}

static void
put_indexes(uint8_t * a_p, const std::vector<Ext4ImageBuilder::Index> & a_idx)
{
    for (size_t i = 0; i < a_idx.size(); i++) {
        uint8_t *e = a_p + sizeof(ext4fs_extent_header) +
            i * sizeof(ext4fs_extent_idx);
        const Ext4ImageBuilder::Index & x = a_idx[i];
        for (int b = 0; b < 4; b++) {
            e[b] = (uint8_t) ((x.lblk >> (8 * b)) & 0xff);
            e[4 + b] = (uint8_t) ((x.pblk >> (8 * b)) & 0xff);
        }
        e[8] = (uint8_t) ((x.pblk >> 32) & 0xff);
        e[9] = (uint8_t) ((x.pblk >> 40) & 0xff);
    }
}

void
Ext4ImageBuilder::setExtentLeafRoot(uint32_t a_ino,
    const std::vector<Extent> & a_ext)
{
    ext4fs_inode *in = (ext4fs_inode *) inode(a_ino);
    memset(in->i_block, 0, sizeof(in->i_block));
    put_extent_header(in->i_block, (uint16_t) a_ext.size(), 4, 0);
    put_extents(in->i_block, a_ext);
}

void
Ext4ImageBuilder::setExtentIndexRoot(uint32_t a_ino, uint16_t a_depth,
    const std::vector<Index> & a_idx)
{
    ext4fs_inode *in = (ext4fs_inode *) inode(a_ino);
    memset(in->i_block, 0, sizeof(in->i_block));
    put_extent_header(in->i_block, (uint16_t) a_idx.size(), 4, a_depth);
    put_indexes(in->i_block, a_idx);
}

void
Ext4ImageBuilder::writeExtentLeaf(uint64_t a_blk,
    const std::vector<Extent> & a_ext)
{
    uint8_t *p = block(a_blk);
    memset(p, 0, m_block_size);
    put_extent_header(p, (uint16_t) a_ext.size(),
        (uint16_t) ((m_block_size - 12) / 12), 0);
    put_extents(p, a_ext);
}

void
Ext4ImageBuilder::writeExtentIndex(uint64_t a_blk, uint16_t a_depth,
    const std::vector<Index> & a_idx)
{
    uint8_t *p = block(a_blk);
    memset(p, 0, m_block_size);
    put_extent_header(p, (uint16_t) a_idx.size(),
        (uint16_t) ((m_block_size - 12) / 12), a_depth);
    put_indexes(p, a_idx);
}

void
Ext4ImageBuilder::writeXattrEntries(uint8_t * a_area, size_t a_len,
    size_t a_first, size_t a_value_base, const std::vector<Xattr> & a_xattrs)
{
    size_t pos = a_first;
    size_t value_end = a_len;

    for (const Xattr & x : a_xattrs) {
        ext4fs_xattr_entry *ent = (ext4fs_xattr_entry *) &a_area[pos];
        const size_t ent_len = EXT4_XATTR_LEN(x.name.size());
        if (pos + ent_len + 4 > value_end)
            throw std::runtime_error("attribute area is full");

        ent->e_name_len = (uint8_t) x.name.size();
        ent->e_name_index = x.index;
        put32(ent->e_value_size, (uint32_t) x.value.size());
        if (x.value_inum != 0) {
            put32(ent->e_value_inum, x.value_inum);
        }
        else {
            const size_t padded = (x.value.size() + 3) & ~((size_t) 3);
            if (value_end < padded || value_end - padded < pos + ent_len + 4)
                throw std::runtime_error("attribute area is full");
            value_end -= padded;
            memcpy(&a_area[value_end], x.value.data(), x.value.size());
            put16(ent->e_value_offs, (uint16_t) (value_end - a_value_base));
        }
        memcpy(&a_area[pos + sizeof(ext4fs_xattr_entry)], x.name.data(),
            x.name.size());
        pos += ent_len;
    }
    // terminating zero word
    memset(&a_area[pos], 0, 4);
}

void
Ext4ImageBuilder::setInodeXattrs(uint32_t a_ino,
    const std::vector<Xattr> & a_xattrs)
{
    uint8_t *raw = inode(a_ino);
    const size_t ibody = EXT4FS_GOOD_OLD_INODE_SIZE + EXTRA_ISIZE;
    memset(raw + ibody, 0, INODE_SIZE - ibody);
    put32(raw + ibody, EXT4_XATTR_MAGIC);
    writeXattrEntries(raw, INODE_SIZE, ibody + 4, ibody + 4, a_xattrs);
}

uint64_t
Ext4ImageBuilder::setXattrBlock(uint32_t a_ino,
    const std::vector<Xattr> & a_xattrs)
{
    uint64_t blk = allocBlocks(1);
    uint8_t *p = block(blk);
    memset(p, 0, m_block_size);

    ext4fs_xattr_header *hdr = (ext4fs_xattr_header *) p;
    put32(hdr->h_magic, EXT4_XATTR_MAGIC);
    put32(hdr->h_refcount, 1);
    put32(hdr->h_blocks, 1);
    writeXattrEntries(p, m_block_size, sizeof(ext4fs_xattr_header), 0,
        a_xattrs);

    ext4fs_inode *in = (ext4fs_inode *) inode(a_ino);
    put32(in->i_file_acl, (uint32_t) blk);
    put16(in->i_file_acl_high, (uint16_t) (blk >> 32));
    return blk;
}

void
Ext4ImageBuilder::link(uint32_t a_parent, const std::string & a_name,
    uint32_t a_ino, uint8_t a_type)
{
    m_dirs.at(a_parent).push_back(DirEntry { a_ino, a_type, a_name });
}

uint32_t
Ext4ImageBuilder::makeDirInode(uint32_t a_parent, bool a_inline)
{
    const uint32_t ino = (a_parent == ROOT_INO && m_dirs.empty())
        ? ROOT_INO : newInode();

    if (a_inline) {
        setIncompat(incompat() | EXT4FS_FEATURE_INCOMPAT_INLINE_DATA);
        setInode(ino, EXT4_IN_DIR | 0755, EXT4FS_FILE_CONTENT_LEN,
            EXT4_IN_INLINE_DATA);
        setInodeXattrs(ino, { {EXT4_XATTR_INDEX_SYSTEM, "data", "", 0} });
    }
    else {
        uint64_t blk = allocBlocks(1);
        setInode(ino, EXT4_IN_DIR | 0755, m_block_size, EXT4_IN_EXTENTS);
        setExtentLeafRoot(ino, { {0, 1, blk, false} });
        m_dir_blocks[ino] = blk;
    }
    put16(((ext4fs_inode *) inode(ino))->i_nlink, 2);
    m_dirs[ino];
    m_parents[ino] = a_parent;
    return ino;
}

uint32_t
Ext4ImageBuilder::addDir(uint32_t a_parent, const std::string & a_name)
{
    uint32_t ino = makeDirInode(a_parent, false);
    link(a_parent, a_name, ino, EXT4_DE_DIR);
    return ino;
}

uint32_t
Ext4ImageBuilder::addInlineDir(uint32_t a_parent, const std::string & a_name)
{
    uint32_t ino = makeDirInode(a_parent, true);
    link(a_parent, a_name, ino, EXT4_DE_DIR);
    return ino;
}

uint32_t
Ext4ImageBuilder::addFile(uint32_t a_parent, const std::string & a_name,
    const std::string & a_content)
{
    const uint32_t ino = newInode();
    const uint32_t nblocks =
        (uint32_t) ((a_content.size() + m_block_size - 1) / m_block_size);

    setInode(ino, EXT4_IN_REG | 0644, a_content.size(), EXT4_IN_EXTENTS);
    if (nblocks > 0) {
        uint64_t blk = allocBlocks(nblocks);
        writeData(blk, a_content);
        setExtentLeafRoot(ino, { {0, (uint16_t) nblocks, blk, false} });
    }
    else {
        setExtentLeafRoot(ino, {});
    }
    link(a_parent, a_name, ino, EXT4_DE_REG);
    return ino;
}

uint32_t
Ext4ImageBuilder::addFileExtents(uint32_t a_parent, const std::string & a_name,
    uint64_t a_size, const std::vector<Extent> & a_ext)
{
    const uint32_t ino = newInode();
    setInode(ino, EXT4_IN_REG | 0644, a_size, EXT4_IN_EXTENTS);
    setExtentLeafRoot(ino, a_ext);
    link(a_parent, a_name, ino, EXT4_DE_REG);
    return ino;
}

uint32_t
Ext4ImageBuilder::addInlineFile(uint32_t a_parent, const std::string & a_name,
    const std::string & a_content)
{
    const uint32_t ino = newInode();
    setIncompat(incompat() | EXT4FS_FEATURE_INCOMPAT_INLINE_DATA);
    setInode(ino, EXT4_IN_REG | 0644, a_content.size(), EXT4_IN_INLINE_DATA);

    ext4fs_inode *in = (ext4fs_inode *) inode(ino);
    const size_t head = a_content.size() < EXT4FS_FILE_CONTENT_LEN ?
        a_content.size() : EXT4FS_FILE_CONTENT_LEN;
    memcpy(in->i_block, a_content.data(), head);
    setInodeXattrs(ino, { {EXT4_XATTR_INDEX_SYSTEM, "data",
                a_content.substr(head), 0} });
    link(a_parent, a_name, ino, EXT4_DE_REG);
    return ino;
}

uint32_t
Ext4ImageBuilder::addMappedFile(uint32_t a_parent, const std::string & a_name,
    const std::string & a_content)
{
    const uint32_t ino = newInode();
    const uint32_t nblocks =
        (uint32_t) ((a_content.size() + m_block_size - 1) / m_block_size);
    if (nblocks > 12)
        throw std::runtime_error("only direct blocks are written");

    setInode(ino, EXT4_IN_REG | 0644, a_content.size(), 0);
    if (nblocks > 0) {
        uint64_t blk = allocBlocks(nblocks);
        writeData(blk, a_content);
        ext4fs_inode *in = (ext4fs_inode *) inode(ino);
        for (uint32_t i = 0; i < nblocks; i++)
            put32(in->i_block + 4 * i, (uint32_t) (blk + i));
    }
    link(a_parent, a_name, ino, EXT4_DE_REG);
    return ino;
}

uint32_t
Ext4ImageBuilder::addSymlink(uint32_t a_parent, const std::string & a_name,
    const std::string & a_target)
{
    const uint32_t ino = newInode();

    if (a_target.size() < EXT4FS_FILE_CONTENT_LEN) {
        setInode(ino, EXT4_IN_LNK | 0777, a_target.size(), 0);
        ext4fs_inode *in = (ext4fs_inode *) inode(ino);
        memcpy(in->i_block, a_target.data(), a_target.size());
    }
    else {
        const uint32_t nblocks =
            (uint32_t) ((a_target.size() + m_block_size - 1) / m_block_size);
        uint64_t blk = allocBlocks(nblocks);
        writeData(blk, a_target);
        setInode(ino, EXT4_IN_LNK | 0777, a_target.size(), EXT4_IN_EXTENTS);
        setExtentLeafRoot(ino, { {0, (uint16_t) nblocks, blk, false} });
    }
    link(a_parent, a_name, ino, EXT4_DE_LNK);
    return ino;
}

uint32_t
Ext4ImageBuilder::addSpecial(uint32_t a_parent, const std::string & a_name,
    uint16_t a_mode)
{
    const uint32_t ino = newInode();
    setInode(ino, a_mode, 0, 0);

    uint8_t type = EXT4_DE_UNKNOWN;
    switch (a_mode & EXT4_IN_FMT) {
    case EXT4_IN_FIFO:
        type = EXT4_DE_FIFO;
        break;
    case EXT4_IN_CHR:
        type = EXT4_DE_CHR;
        break;
    case EXT4_IN_BLK:
        type = EXT4_DE_BLK;
        break;
    case EXT4_IN_SOCK:
        type = EXT4_DE_SOCK;
        break;
    }
    link(a_parent, a_name, ino, type);
    return ino;
}

void
Ext4ImageBuilder::encodeDirBlock(uint8_t * a_buf, size_t a_len,
    const std::vector<DirEntry> & a_entries)
{
    memset(a_buf, 0, a_len);
    if (a_entries.empty()) {
        // one unused entry covering the region
        a_buf[4] = (uint8_t) (a_len & 0xff);
        a_buf[5] = (uint8_t) ((a_len >> 8) & 0xff);
        return;
    }

    size_t pos = 0;
    for (size_t i = 0; i < a_entries.size(); i++) {
        const DirEntry & d = a_entries[i];
        size_t rec = (EXT4FS_DENTRY_HDR_LEN + d.name.size() + 3) & ~3;
        if (i + 1 == a_entries.size())
            rec = a_len - pos;
        if (pos + rec > a_len || rec < EXT4FS_DENTRY_HDR_LEN + d.name.size())
            throw std::runtime_error("directory entries do not fit");

        uint8_t *e = a_buf + pos;
        for (int b = 0; b < 4; b++)
            e[b] = (uint8_t) ((d.ino >> (8 * b)) & 0xff);
        // 65536 does not fit and is stored as 0
        e[4] = (uint8_t) (rec & 0xff);
        e[5] = (uint8_t) ((rec >> 8) & 0xff);
        e[6] = (uint8_t) d.name.size();
        e[7] = d.type;
        memcpy(e + EXT4FS_DENTRY_HDR_LEN, d.name.data(), d.name.size());
        pos += rec;
    }
}

void
Ext4ImageBuilder::finish()
{
    for (const auto & dir : m_dirs) {
        const uint32_t ino = dir.first;
        auto blk = m_dir_blocks.find(ino);

        if (blk == m_dir_blocks.end()) {
            ext4fs_inode *in = (ext4fs_inode *) inode(ino);
            put32(in->i_block, m_parents[ino]);
            encodeDirBlock(in->i_block + EXT4_INLINE_DOTDOT_SIZE,
                EXT4FS_FILE_CONTENT_LEN - EXT4_INLINE_DOTDOT_SIZE,
                dir.second);
        }
        else {
            std::vector<DirEntry> entries;
            entries.push_back(DirEntry { ino, EXT4_DE_DIR, "." });
            entries.push_back(DirEntry { m_parents[ino], EXT4_DE_DIR, ".." });
            entries.insert(entries.end(), dir.second.begin(),
                dir.second.end());
            encodeDirBlock(block(blk->second), m_block_size, entries);
        }
    }
}

void
Ext4ImageBuilder::write(const std::filesystem::path & a_path)
{
    std::ofstream out(a_path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot create image file");
    out.write((const char *) m_img.data(), (std::streamsize) m_img.size());
    if (!out)
        throw std::runtime_error("cannot write image file");
}
