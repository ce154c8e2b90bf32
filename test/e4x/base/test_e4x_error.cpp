/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "e4x/libe4x.h"
#include "e4x/base/e4x_base_i.h"

#include <cstring>
#include <future>
#include <string>
#include <thread>

#include "catch.hpp"
#include "test/runner.h"

TEST_CASE("error record starts empty","[errors]") {
  e4x_error_reset();
  E4X_ERROR_INFO *ei = e4x_error_get_info();
  REQUIRE(0 == ei->t_errno);
  REQUIRE(0 == ei->errstr[0]);
  REQUIRE(0 == ei->errstr2[0]);
  REQUIRE(e4x_error_get() == NULL);
}

TEST_CASE("error strings are capped","[errors]") {
  e4x_error_reset();
  const std::string s(4096, 'x');
  e4x_error_set_errstr("%s", s.c_str());
  std::string es(e4x_error_get_errstr());
  REQUIRE(es.size() < 1025);

  e4x_error_set_errstr2("%s", s.c_str());
  e4x_error_errstr2_concat("%s", "more");
  REQUIRE(std::strlen(e4x_error_get_errstr2()) < 1025);
  e4x_error_reset();
}

TEST_CASE("error message combines code and strings","[errors]") {
  e4x_error_reset();
  e4x_error_set_errno(E4X_ERR_FS_DIR_COR);
  e4x_error_set_errstr("entry at offset %d", 12);
  e4x_error_set_errstr2("directory %d", 2);
  e4x_error_errstr2_concat(" - %s", "dir1");
  REQUIRE(std::string(e4x_error_get()) ==
      "Corrupt directory (entry at offset 12) (directory 2 - dir1)");

  e4x_error_set_errno(E4X_ERR_FS_UNSUPFEAT);
  REQUIRE(runner::contains(e4x_error_get(), "Unsupported file system feature"));

  e4x_error_set_errno(E4X_ERR_AUTO_WRITE);
  REQUIRE(runner::contains(e4x_error_get(), "Error writing output"));

  E4xError::reset();
  REQUIRE(E4xError::get() == NULL);
}

TEST_CASE("error print writes one line","[errors]") {
  runner::tempfile tf("e4x_error_print");
  e4x_error_reset();
  e4x_error_set_errno(E4X_ERR_FS_MAGIC);
  e4x_error_set_errstr("bad magic");
  E4xError::print(tf.file);
  REQUIRE(tf.first_line() == "Invalid superblock (bad magic)");
  e4x_error_reset();
}

TEST_CASE("error records are per thread","[errors]") {
  e4x_error_reset();
  e4x_error_set_errno(E4X_ERR_IMG_READ);
  e4x_error_set_errstr("main thread");

  std::promise<void> child_set;
  std::promise<void> main_checked;
  std::future<void> go_on = main_checked.get_future();
  std::string child_msg;
  uint32_t child_errno = 0;

  std::thread child([&] {
    // a new thread starts with an empty record
    child_errno = e4x_error_get_errno();
    e4x_error_set_errno(E4X_ERR_FS_EXTENT_COR);
    e4x_error_set_errstr("child thread");
    e4x_error_set_errstr2("inode %d", 12);
    child_set.set_value();

    go_on.wait();
    const char *msg = e4x_error_get();
    child_msg = msg ? msg : "";
  });

  child_set.get_future().wait();
  CHECK(e4x_error_get_errno() == E4X_ERR_IMG_READ);
  CHECK(std::string(e4x_error_get_errstr()) == "main thread");
  CHECK(std::strlen(e4x_error_get_errstr2()) == 0);
  e4x_error_reset();
  main_checked.set_value();
  child.join();

  CHECK(child_errno == 0);
  CHECK(runner::contains(child_msg, "(child thread) (inode 12)"));
}

TEST_CASE("e4x_parse_offset","[base]") {
  REQUIRE(e4x_parse_offset("0") == 0);
  REQUIRE(e4x_parse_offset("2048") == 2048);
  REQUIRE(e4x_parse_offset("0x10") == 16);

  REQUIRE(e4x_parse_offset("-1") == -1);
  REQUIRE(e4x_error_get_errno() == E4X_ERR_IMG_OFFSET);
  REQUIRE(e4x_parse_offset("12abc") == -1);
  REQUIRE(e4x_parse_offset("") == -1);
  e4x_error_reset();
}

TEST_CASE("e4x_print_sanitized replaces control characters","[base]") {
  runner::tempfile tf("e4x_print_sanitized");
  REQUIRE(e4x_print_sanitized(tf.file, "a\tb\x01" "c") == 0);
  REQUIRE(tf.validate_contents("a^b^c"));
}

TEST_CASE("e4x_crc16","[base]") {
  const char *check = "123456789";
  REQUIRE(e4x_crc16(0xffff, (const uint8_t *) check, 9) == 0x4b37);
  // the sum can be built in pieces
  uint16_t crc = e4x_crc16(0xffff, (const uint8_t *) check, 4);
  REQUIRE(e4x_crc16(crc, (const uint8_t *) check + 4, 5) == 0x4b37);
}

TEST_CASE("e4x_version_get_str","[base]") {
  REQUIRE(std::strlen(e4x_version_get_str()) > 0);
}
