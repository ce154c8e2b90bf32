/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x/libe4x.h"
#include "e4x/fs/e4x_ext4fs.h"
#include "test/e4x/fs/ext4_image_builder.h"
#include "test/e4x/fs/ext4_test_image.h"

#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "catch.hpp"
#include "test/runner.h"

TEST_CASE("open a 1 KiB block file system", "[ext4fs]") {
  Ext4ImageBuilder b;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  CHECK(t.fs.getBlockSize() == 1024);
  CHECK(t.fs.getBlockCount() == 1024);
  CHECK(t.fs.getRootINum() == 2);
  CHECK(t.get()->first_inum == 1);
  CHECK(t.get()->last_inum == Ext4ImageBuilder::INODES_COUNT);
  CHECK(t.get()->last_block_act == 1023);
  CHECK(t.get()->fs_id_used == 16);
  CHECK(t.get()->fs_id[0] == 0x10);
}

TEST_CASE("open a 4 KiB block file system", "[ext4fs]") {
  Ext4ImageBuilder b(4096, 64);
  b.addFile(Ext4ImageBuilder::ROOT_INO, "f", std::string(5000, 'q'));
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);
  CHECK(t.fs.getBlockSize() == 4096);

  dir_ptr root = open_dir(t.get(), 2);
  REQUIRE(root);
  CHECK(list_dir(root.get()) == std::vector<std::string>{".", "..", "f"});
  file_ptr f = open_inode(t.get(), 11);
  REQUIRE(f);
  CHECK(read_all(f.get()) == std::string(5000, 'q'));
}

TEST_CASE("fsstat describes the file system", "[ext4fs]") {
  Ext4ImageBuilder b;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  runner::tempfile out("fsstat");
  REQUIRE(e4x_fs_fsstat(t.get(), out.file) == 0);
  CHECK(out.first_line() == "FILE SYSTEM INFORMATION");
  CHECK(out.validate_contains("Volume Name: testvol"));
  CHECK(out.validate_contains("Volume ID: 1f1e1d1c1b1a19181716151413121110"));
  CHECK(out.validate_contains("InCompat Features: Filetype, Extents, "));
  CHECK(out.validate_contains("Root Directory: 2"));
  CHECK(out.validate_contains("Block Size: 1024"));
  CHECK(out.validate_contains("Number of Block Groups: 1"));
}

TEST_CASE("bad superblock magic", "[ext4fs]") {
  Ext4ImageBuilder b;
  ((ext4fs_sb *) b.superblock())->s_magic[0] = 0x52;
  Ext4TestImage t(b);
  REQUIRE(t.img.get() != NULL);
  CHECK(t.get() == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_MAGIC);
  CHECK(runner::contains(e4x_error_get(), "Invalid superblock"));
}

TEST_CASE("file system without extents", "[ext4fs]") {
  Ext4ImageBuilder b;
  b.setIncompat(EXT4FS_FEATURE_INCOMPAT_FILETYPE);
  Ext4TestImage t(b);
  REQUIRE(t.img.get() != NULL);
  CHECK(t.get() == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_UNSUPFEAT);
}

TEST_CASE("invalid inode size", "[ext4fs]") {
  Ext4ImageBuilder b;
  ext4fs_sb *sb = (ext4fs_sb *) b.superblock();
  sb->s_inode_size[0] = 200;
  sb->s_inode_size[1] = 0;
  Ext4TestImage t(b);
  CHECK(t.get() == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_MAGIC);
}

static EXT4FS_INFO *
ext4_of(const Ext4TestImage & a_t)
{
  return (EXT4FS_INFO *) a_t.get();
}

/* stores the crc16 that a descriptor of a_len bytes in group 0 carries */
static void
store_gd_checksum(Ext4ImageBuilder & a_b, size_t a_len)
{
  uint8_t *gd = a_b.groupDesc();
  const uint8_t grp[4] = { 0, 0, 0, 0 };
  uint16_t crc = e4x_crc16(0xffff,
      ((ext4fs_sb *) a_b.superblock())->s_uuid, 16);
  crc = e4x_crc16(crc, grp, sizeof(grp));
  crc = e4x_crc16(crc, gd, EXT4FS_GD_CHECKSUM_OFF);
  crc = e4x_crc16(crc, gd + EXT4FS_GD_CHECKSUM_OFF + 2,
      a_len - EXT4FS_GD_CHECKSUM_OFF - 2);
  gd[EXT4FS_GD_CHECKSUM_OFF] = (uint8_t) (crc & 0xff);
  gd[EXT4FS_GD_CHECKSUM_OFF + 1] = (uint8_t) (crc >> 8);
}

TEST_CASE("64-bit group descriptors", "[ext4fs]") {
  Ext4ImageBuilder b;
  b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "wide descriptors");
  b.set64Bit();
  ext4fs_gd *gd = (ext4fs_gd *) b.groupDesc();
  const uint16_t free_lo = gd->bg_free_inodes_count_lo[0]
      | (gd->bg_free_inodes_count_lo[1] << 8);
  gd->bg_free_inodes_count_hi[0] = 1;
  gd->bg_used_dirs_count_hi[0] = 2;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  CHECK(ext4_of(t)->gd_size == 64);
  CHECK(ext4_of(t)->groups_count == 1);
  CHECK(ext4_of(t)->groups[0].free_inodes_count == (0x10000u | free_lo));
  CHECK((ext4_of(t)->groups[0].used_dirs_count >> 16) == 2);

  // the inode table address still comes out right
  file_ptr f = open_inode(t.get(), 11);
  REQUIRE(f);
  CHECK(read_all(f.get()) == "wide descriptors");
}

TEST_CASE("64-bit descriptor size below 64", "[ext4fs]") {
  Ext4ImageBuilder b;
  b.set64Bit(32);
  Ext4TestImage t(b);
  REQUIRE(t.img.get() != NULL);
  CHECK(t.get() == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_MAGIC);
}

TEST_CASE("group descriptor table past the end of the device", "[ext4fs]") {
  Ext4ImageBuilder b;
  // block 1 holds the superblock, the table would be block 2
  ext4fs_sb *sb = (ext4fs_sb *) b.superblock();
  memset(sb->s_blocks_count, 0, sizeof(sb->s_blocks_count));
  sb->s_blocks_count[0] = 2;
  Ext4TestImage t(b);
  REQUIRE(t.img.get() != NULL);
  CHECK(t.get() == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_CORRUPT);
  CHECK(runner::contains(e4x_error_get_errstr(), "extends past the end"));
}

TEST_CASE("group descriptor checksums", "[ext4fs]") {
  Ext4ImageBuilder b;
  b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "checked");
  b.setRoCompat(EXT4FS_FEATURE_RO_COMPAT_GDT_CSUM);
  b.finish();

  SECTION("matching checksum") {
    store_gd_checksum(b, EXT4FS_GD_SIZE);
    Ext4TestImage t(b);
    REQUIRE(t.get() != NULL);
    CHECK(ext4_of(t)->gd_csum_bad == 0);
    CHECK(ext4_of(t)->groups[0].checksum_ok == 1);
  }

  SECTION("matching checksum over a 64 byte descriptor") {
    b.set64Bit();
    b.groupDesc()[0x2e] = 3;    // bg_free_inodes_count_hi is covered
    store_gd_checksum(b, EXT4FS_GD_SIZE_64BIT);
    Ext4TestImage t(b);
    REQUIRE(t.get() != NULL);
    CHECK(ext4_of(t)->gd_csum_bad == 0);
  }

  SECTION("mismatch is counted, the file system still opens") {
    store_gd_checksum(b, EXT4FS_GD_SIZE);
    b.groupDesc()[EXT4FS_GD_CHECKSUM_OFF] ^= 0x5a;
    Ext4TestImage t(b);
    REQUIRE(t.get() != NULL);
    CHECK(ext4_of(t)->gd_csum_bad == 1);
    CHECK(ext4_of(t)->groups[0].checksum_ok == 0);

    file_ptr f = open_inode(t.get(), 11);
    REQUIRE(f);
    CHECK(read_all(f.get()) == "checked");
  }
}

TEST_CASE("file system offset outside the image", "[ext4fs]") {
  Ext4ImageBuilder b;
  Ext4TestImage t(b);
  REQUIRE(t.img.get() != NULL);
  CHECK(e4x_fs_open_img(t.img.get(), t.img.getSize()) == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_IMG_OFFSET);
  CHECK(e4x_fs_open_img(NULL, 0) == NULL);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_ARG);
}

TEST_CASE("file system at an offset in the image", "[ext4fs]") {
  Ext4ImageBuilder b;
  b.addFile(Ext4ImageBuilder::ROOT_INO, "a.txt", "offset data");
  b.finish();

  runner::tempdir dir("ext4_offset");
  const std::string plain = (dir.path / "plain.raw").string();
  b.write(plain);
  const std::string image = runner::file_contents(plain);
  const std::string path = (dir.path / "disk.raw").string();
  {
    std::ofstream out(path, std::ios::binary);
    const std::string pad(2048 * 512, '\0');
    out.write(pad.data(), pad.size());
    out.write(image.data(), image.size());
  }

  E4xImgInfo img;
  const char *const images[] = { path.c_str() };
  REQUIRE(img.open(1, images, E4X_IMG_TYPE_DETECT, 0) == 0);
  E4xFsInfo fs;
  CHECK(fs.open(img.get(), 0) == 1);
  REQUIRE(fs.open(img.get(), 2048 * 512) == 0);
  file_ptr f = open_inode(fs.get(), 11);
  REQUIRE(f);
  CHECK(read_all(f.get()) == "offset data");
}

TEST_CASE("inode numbers outside the table", "[ext4fs]") {
  Ext4ImageBuilder b;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  CHECK(!open_inode(t.get(), 0));
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_INODE_NUM);
  CHECK(!open_inode(t.get(), Ext4ImageBuilder::INODES_COUNT + 1));
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_INODE_NUM);
}

TEST_CASE("inode metadata", "[ext4fs]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "hello.txt",
      "hello world\n");
  b.setOwner(ino, 70000, 1001);
  b.setTimes(ino, 1700000000, 123, 1700000001, 456);
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  const E4X_FS_META *m = f->meta;
  CHECK(m->addr == ino);
  CHECK(m->type == E4X_FS_META_TYPE_REG);
  CHECK(m->mode == 0644);
  CHECK(m->nlink == 1);
  CHECK(m->size == 12);
  CHECK(m->uid == 70000);
  CHECK(m->gid == 1001);
  CHECK(m->atime == 1700000000);
  CHECK(m->atime_nano == 123);
  CHECK(m->mtime == 1700000001);
  CHECK(m->mtime_nano == 456);
  CHECK(m->ctime == 1600000000);
  CHECK(m->crtime == 1500000000);
  CHECK(m->content_type == E4X_FS_META_CONTENT_TYPE_EXTENTS);
  CHECK(m->extra_isize == Ext4ImageBuilder::EXTRA_ISIZE);
  CHECK(m->inode_len == Ext4ImageBuilder::INODE_SIZE);

  char ls[12];
  REQUIRE(e4x_fs_meta_make_ls(m, ls, sizeof(ls)) == 0);
  CHECK(std::string(ls) == "-rw-r--r--");

  file_ptr root = open_inode(t.get(), 2);
  REQUIRE(root);
  CHECK(root->meta->type == E4X_FS_META_TYPE_DIR);
  REQUIRE(e4x_fs_meta_make_ls(root->meta, ls, sizeof(ls)) == 0);
  CHECK(std::string(ls) == "drwxr-xr-x");
}

TEST_CASE("small inodes have no creation time", "[ext4fs]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "old", "x");
  ext4fs_inode *in = (ext4fs_inode *) b.inode(ino);
  in->i_extra_isize[0] = 0;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  CHECK(f->meta->crtime == 0);
  CHECK(f->meta->atime_nano == 0);
}

TEST_CASE("partial reads of a file", "[ext4fs]") {
  Ext4ImageBuilder b;
  std::string content;
  for (int i = 0; i < 3000; i++)
    content += (char) ('a' + i % 26);
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "abc", content);
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  char buf[100];
  REQUIRE(e4x_fs_file_read(f.get(), 1000, buf, 100) == 100);
  CHECK(std::string(buf, 100) == content.substr(1000, 100));

  // clipped at the end of the file
  CHECK(e4x_fs_file_read(f.get(), 2950, buf, 100) == 50);
  CHECK(e4x_fs_file_read(f.get(), 3000, buf, 100) == 0);
  CHECK(e4x_fs_file_read(f.get(), 3001, buf, 100) == -1);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_READ_OFF);
}

TEST_CASE("inline file content", "[ext4fs]") {
  Ext4ImageBuilder b;
  const std::string content(80, 'i');
  const uint32_t ino = b.addInlineFile(Ext4ImageBuilder::ROOT_INO, "inl",
      content);
  const uint32_t small = b.addInlineFile(Ext4ImageBuilder::ROOT_INO, "s",
      "tiny");
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  CHECK(f->meta->content_type == E4X_FS_META_CONTENT_TYPE_INLINE);
  CHECK(read_all(f.get()) == content);

  file_ptr s = open_inode(t.get(), small);
  REQUIRE(s);
  CHECK(read_all(s.get()) == "tiny");
}

TEST_CASE("inline file larger than its data", "[ext4fs]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addInlineFile(Ext4ImageBuilder::ROOT_INO, "inl",
      std::string(70, 'i'));
  ((ext4fs_inode *) b.inode(ino))->i_size[0] = 200;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  char buf[200];
  CHECK(e4x_fs_file_read(f.get(), 0, buf, sizeof(buf)) == -1);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_CORRUPT);
}

TEST_CASE("fast and slow symbolic links", "[ext4fs]") {
  Ext4ImageBuilder b;
  const std::string long_target = "/" + std::string(100, 'x') + "/target";
  const uint32_t fast = b.addSymlink(Ext4ImageBuilder::ROOT_INO, "fast",
      "../etc/passwd");
  const uint32_t slow = b.addSymlink(Ext4ImageBuilder::ROOT_INO, "slow",
      long_target);
  const uint32_t reg = b.addFile(Ext4ImageBuilder::ROOT_INO, "reg", "x");
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  char buf[E4X_FS_LINK_MAX];
  file_ptr f = open_inode(t.get(), fast);
  REQUIRE(f);
  CHECK(f->meta->content_type == E4X_FS_META_CONTENT_TYPE_FAST_LINK);
  REQUIRE(e4x_fs_file_readlink(f.get(), buf, sizeof(buf)) == 13);
  CHECK(std::string(buf) == "../etc/passwd");

  file_ptr s = open_inode(t.get(), slow);
  REQUIRE(s);
  CHECK(s->meta->content_type == E4X_FS_META_CONTENT_TYPE_EXTENTS);
  REQUIRE(e4x_fs_file_readlink(s.get(), buf, sizeof(buf)) ==
      (ssize_t) long_target.size());
  CHECK(std::string(buf) == long_target);

  // too small a buffer
  CHECK(e4x_fs_file_readlink(s.get(), buf, 10) == -1);

  file_ptr r = open_inode(t.get(), reg);
  REQUIRE(r);
  CHECK(e4x_fs_file_readlink(r.get(), buf, sizeof(buf)) == -1);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_ARG);
}

TEST_CASE("block mapped files are not supported", "[ext4fs]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addMappedFile(Ext4ImageBuilder::ROOT_INO, "old",
      "mapped content");
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), ino);
  REQUIRE(f);
  CHECK(f->meta->content_type == E4X_FS_META_CONTENT_TYPE_MAPPED);

  std::vector<E4X_FS_ATTR_RUN> runs;
  CHECK(e4x_fs_file_extents(f.get(), runs) == E4X_ERR);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_UNSUPFEAT);

  char buf[16];
  CHECK(e4x_fs_file_read(f.get(), 0, buf, sizeof(buf)) == -1);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_UNSUPFEAT);
}

TEST_CASE("special files have no content", "[ext4fs]") {
  Ext4ImageBuilder b;
  const uint32_t fifo = b.addSpecial(Ext4ImageBuilder::ROOT_INO, "pipe",
      EXT4_IN_FIFO | 0600);
  const uint32_t chr = b.addSpecial(Ext4ImageBuilder::ROOT_INO, "tty",
      EXT4_IN_CHR | 0620);
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  file_ptr f = open_inode(t.get(), fifo);
  REQUIRE(f);
  CHECK(f->meta->type == E4X_FS_META_TYPE_FIFO);
  CHECK(f->meta->content_type == E4X_FS_META_CONTENT_TYPE_DEFAULT);
  std::vector<E4X_FS_ATTR_RUN> runs;
  CHECK(e4x_fs_file_extents(f.get(), runs) == E4X_OK);
  CHECK(runs.empty());

  file_ptr c = open_inode(t.get(), chr);
  REQUIRE(c);
  CHECK(c->meta->type == E4X_FS_META_TYPE_CHR);
  char ls[11];
  REQUIRE(e4x_fs_meta_make_ls(c->meta, ls, sizeof(ls)) == 0);
  CHECK(std::string(ls) == "crw--w----");
}
