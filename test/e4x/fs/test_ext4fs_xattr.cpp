/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x/libe4x.h"
#include "e4x/fs/e4x_ext4fs.h"
#include "test/e4x/fs/ext4_image_builder.h"
#include "test/e4x/fs/ext4_test_image.h"

#include <string>
#include <vector>

#include "catch.hpp"

static E4X_RETVAL_ENUM
xattrs_of(E4X_FS_INFO * a_fs, uint32_t a_ino, std::vector<E4X_FS_XATTR> &a_xattrs)
{
  file_ptr f = open_inode(a_fs, a_ino);
  REQUIRE(f);
  return e4x_fs_file_xattrs(f.get(), a_xattrs);
}

TEST_CASE("attributes in the inode and in a block", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, {
      {EXT4_XATTR_INDEX_USER, "color", "blue", 0},
      {EXT4_XATTR_INDEX_SECURITY, "selinux", "system_u:object_r", 0} });
  b.setXattrBlock(ino, {
      {EXT4_XATTR_INDEX_USER, "color", "red", 0},
      {EXT4_XATTR_INDEX_TRUSTED, "bin", std::string("\x01\x00\x02", 3), 0} });
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  REQUIRE(xattrs_of(t.get(), ino, xattrs) == E4X_OK);
  REQUIRE(xattrs.size() == 3);

  // the in-inode value wins over the block
  CHECK(xattrs[0].full_name == "user.color");
  CHECK(xattrs[0].name == "color");
  CHECK(xattrs[0].name_index == EXT4_XATTR_INDEX_USER);
  CHECK(xattrs[0].value == "blue");
  CHECK(xattrs[1].full_name == "security.selinux");
  CHECK(xattrs[1].value == "system_u:object_r");
  CHECK(xattrs[2].full_name == "trusted.bin");
  CHECK(xattrs[2].value == std::string("\x01\x00\x02", 3));
}

TEST_CASE("attributes are keyed by index and name", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, {
      {EXT4_XATTR_INDEX_POSIX_ACL_ACCESS, "", "inode acl", 0},
      {40, "c", "forty", 0} });
  // same display names as above, different keys
  b.setXattrBlock(ino, {
      {EXT4_XATTR_INDEX_SYSTEM, "posix_acl_access", "block acl", 0},
      {41, "c", "forty-one", 0},
      {40, "c", "shadowed", 0} });
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  REQUIRE(xattrs_of(t.get(), ino, xattrs) == E4X_OK);
  REQUIRE(xattrs.size() == 4);
  CHECK(xattrs[0].value == "inode acl");
  CHECK(xattrs[1].value == "forty");
  CHECK(xattrs[2].full_name == "system.posix_acl_access");
  CHECK(xattrs[2].name_index == EXT4_XATTR_INDEX_SYSTEM);
  CHECK(xattrs[2].value == "block acl");
  CHECK(xattrs[3].full_name == "c");
  CHECK(xattrs[3].name_index == 41);
  CHECK(xattrs[3].value == "forty-one");
}

TEST_CASE("file without attributes", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  CHECK(xattrs_of(t.get(), ino, xattrs) == E4X_OK);
  CHECK(xattrs.empty());
}

TEST_CASE("attribute name prefixes", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, {
      {EXT4_XATTR_INDEX_POSIX_ACL_ACCESS, "", "acl", 0},
      {EXT4_XATTR_INDEX_SYSTEM, "data", "", 0},
      {42, "odd", "v", 0} });
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  REQUIRE(xattrs_of(t.get(), ino, xattrs) == E4X_OK);
  REQUIRE(xattrs.size() == 3);
  CHECK(xattrs[0].full_name == "system.posix_acl_access");
  CHECK(xattrs[1].full_name == "system.data");
  CHECK(xattrs[1].value.empty());
  CHECK(xattrs[2].full_name == "odd");
}

TEST_CASE("attribute value stored in an inode", "[xattr]") {
  Ext4ImageBuilder b;
  const std::string big(300, 'v');

  const uint32_t vino = b.newInode();
  const uint64_t blk = b.allocBlocks(1);
  b.writeData(blk, big);
  b.setInode(vino, EXT4_IN_REG | 0600, big.size(),
      EXT4_IN_EXTENTS | EXT4_IN_EA_INODE);
  b.setExtentLeafRoot(vino, { {0, 1, blk, false} });

  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, { {EXT4_XATTR_INDEX_USER, "big", big, vino} });
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  REQUIRE(xattrs_of(t.get(), ino, xattrs) == E4X_OK);
  REQUIRE(xattrs.size() == 1);
  CHECK(xattrs[0].full_name == "user.big");
  CHECK(xattrs[0].value == big);
}

TEST_CASE("unreadable value inode", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t other = b.addFile(Ext4ImageBuilder::ROOT_INO, "plain",
      std::string(300, 'p'));
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, {
      {EXT4_XATTR_INDEX_USER, "big", std::string(300, 'p'), other},
      {EXT4_XATTR_INDEX_USER, "ok", "fine", 0} });
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  CHECK(xattrs_of(t.get(), ino, xattrs) == E4X_COR);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_ATTR_COR);
  REQUIRE(xattrs.size() == 1);
  CHECK(xattrs[0].full_name == "user.ok");
}

TEST_CASE("corrupt attribute block", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  b.setInodeXattrs(ino, { {EXT4_XATTR_INDEX_USER, "kept", "yes", 0} });
  const uint64_t blk = b.setXattrBlock(ino,
      { {EXT4_XATTR_INDEX_USER, "lost", "no", 0} });

  SECTION("bad magic") {
    b.block(blk)[3] = 0;
  }
  SECTION("several blocks") {
    // h_blocks
    b.block(blk)[8] = 2;
  }
  SECTION("value offset past the block") {
    // e_value_offs of the first entry
    b.block(blk)[32 + 2] = 0xff;
    b.block(blk)[32 + 3] = 0xff;
  }

  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  CHECK(xattrs_of(t.get(), ino, xattrs) == E4X_COR);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_ATTR_COR);
  REQUIRE(xattrs.size() == 1);
  CHECK(xattrs[0].full_name == "user.kept");
}

TEST_CASE("attribute block outside the device", "[xattr]") {
  Ext4ImageBuilder b;
  const uint32_t ino = b.addFile(Ext4ImageBuilder::ROOT_INO, "f", "data");
  ((ext4fs_inode *) b.inode(ino))->i_file_acl[1] = 0x40;
  Ext4TestImage t(b);
  REQUIRE(t.get() != NULL);

  std::vector<E4X_FS_XATTR> xattrs;
  CHECK(xattrs_of(t.get(), ino, xattrs) == E4X_COR);
  CHECK(e4x_error_get_errno() == E4X_ERR_FS_ATTR_COR);
  CHECK(xattrs.empty());
}
