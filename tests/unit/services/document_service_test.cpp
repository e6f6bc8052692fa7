#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <stdexcept>

#include "docsearch_core/services/document_service.hpp"
#include "../../common/utilities_test.hpp"

namespace docsearch_core {

using docsearch_tests::TestUtilities;

class DocumentServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("docsearch_documents");
    doc_dir_ = temp_dir_ / "document_source";
    std::filesystem::create_directories(doc_dir_);
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path doc_dir_;
};

TEST_F(DocumentServiceTest, ListsFilesSortedByName) {
  TestUtilities::write_file(doc_dir_ / "b.pdf", "12345");
  TestUtilities::write_file(doc_dir_ / "a.pdf", "123");
  TestUtilities::write_file(doc_dir_ / "notes.txt", "1");
  std::filesystem::create_directories(doc_dir_ / "subdir");

  DocumentService service(doc_dir_);
  auto documents = service.list_documents();

  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(documents[0].filename, "a.pdf");
  EXPECT_EQ(documents[0].size, 3u);
  EXPECT_EQ(documents[0].extension, ".pdf");
  EXPECT_EQ(documents[0].filepath, (doc_dir_ / "a.pdf").string());
  EXPECT_EQ(documents[1].filename, "b.pdf");
  EXPECT_EQ(documents[1].size, 5u);
  EXPECT_EQ(documents[2].filename, "notes.txt");
  EXPECT_EQ(documents[2].extension, ".txt");
}

TEST_F(DocumentServiceTest, MissingDirectoryListsNothing) {
  DocumentService service(temp_dir_ / "missing");
  EXPECT_TRUE(service.list_documents().empty());
}

TEST_F(DocumentServiceTest, DeletesExistingFile) {
  TestUtilities::write_file(doc_dir_ / "manual.pdf", "data");
  DocumentService service(doc_dir_);

  EXPECT_TRUE(service.delete_document("manual.pdf"));
  EXPECT_FALSE(std::filesystem::exists(doc_dir_ / "manual.pdf"));
}

TEST_F(DocumentServiceTest, DeletingMissingFileReturnsFalse) {
  DocumentService service(doc_dir_);
  EXPECT_FALSE(service.delete_document("missing.pdf"));
}

TEST_F(DocumentServiceTest, RejectsNamesOutsideDirectory) {
  TestUtilities::write_file(temp_dir_ / "outside.pdf", "data");
  DocumentService service(doc_dir_);

  EXPECT_THROW(service.delete_document("../outside.pdf"), std::invalid_argument);
  EXPECT_THROW(service.delete_document(".."), std::invalid_argument);
  EXPECT_THROW(service.delete_document(""), std::invalid_argument);
  EXPECT_THROW(service.delete_document("sub\\file.pdf"), std::invalid_argument);
  EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "outside.pdf"));
}

TEST_F(DocumentServiceTest, DoesNotDeleteDirectories) {
  std::filesystem::create_directories(doc_dir_ / "folder");
  DocumentService service(doc_dir_);

  EXPECT_FALSE(service.delete_document("folder"));
  EXPECT_TRUE(std::filesystem::exists(doc_dir_ / "folder"));
}

TEST_F(DocumentServiceTest, ListingSkipsHiddenFiles) {
  TestUtilities::write_file(doc_dir_ / "manual.pdf", "data");
  TestUtilities::write_file(doc_dir_ / "._manual.pdf", "fork");

  DocumentService service(doc_dir_);
  auto documents = service.list_documents();

  ASSERT_EQ(documents.size(), 1u);
  EXPECT_EQ(documents[0].filename, "manual.pdf");
}

TEST_F(DocumentServiceTest, ReadsDocumentBytes) {
  const std::string content("%PDF-1.4\n\0binary", 16);
  TestUtilities::write_file(doc_dir_ / "manual.pdf", content);
  DocumentService service(doc_dir_);

  auto read = service.read_document("manual.pdf");

  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(*read, content);
  EXPECT_FALSE(service.read_document("missing.pdf").has_value());
}

TEST_F(DocumentServiceTest, ReadRejectsNamesOutsideDirectory) {
  TestUtilities::write_file(temp_dir_ / "outside.pdf", "secret");
  DocumentService service(doc_dir_);

  EXPECT_THROW(service.read_document("../outside.pdf"), std::invalid_argument);
  EXPECT_THROW(service.read_document(".."), std::invalid_argument);
}

TEST_F(DocumentServiceTest, SavesDocumentAndReportsInfo) {
  DocumentService service(temp_dir_ / "new_source");

  DocumentInfo info = service.save_document("guide.pdf", "%PDF-1.7 body");

  EXPECT_EQ(info.filename, "guide.pdf");
  EXPECT_EQ(info.filepath, (temp_dir_ / "new_source" / "guide.pdf").string());
  EXPECT_EQ(info.size, 13u);
  EXPECT_EQ(info.extension, ".pdf");
  EXPECT_EQ(service.read_document("guide.pdf"), std::optional<std::string>("%PDF-1.7 body"));
  ASSERT_EQ(service.list_documents().size(), 1u);
}

TEST_F(DocumentServiceTest, SaveReplacesExistingDocument) {
  DocumentService service(doc_dir_);
  service.save_document("guide.pdf", "first version");
  service.save_document("guide.pdf", "second");

  EXPECT_EQ(service.read_document("guide.pdf"), std::optional<std::string>("second"));
}

TEST_F(DocumentServiceTest, SaveRejectsBadNamesAndTypes) {
  DocumentService service(doc_dir_);

  EXPECT_THROW(service.save_document("../escape.pdf", "x"), std::invalid_argument);
  EXPECT_THROW(service.save_document("run.sh", "x"), std::invalid_argument);
  EXPECT_THROW(service.save_document("noextension", "x"), std::invalid_argument);
  EXPECT_TRUE(service.list_documents().empty());
}

TEST_F(DocumentServiceTest, UploadExtensionsAreCaseInsensitive) {
  EXPECT_TRUE(DocumentService::is_supported_upload("MANUAL.PDF"));
  EXPECT_TRUE(DocumentService::is_supported_upload("notes.txt"));
  EXPECT_TRUE(DocumentService::is_supported_upload("errata.docx"));
  EXPECT_FALSE(DocumentService::is_supported_upload("archive.zip"));
}

}  // namespace docsearch_core
