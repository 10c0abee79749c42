#include <gtest/gtest.h>

#include "answer_file.hpp"
#include "test_support.hpp"

using namespace test_support;

namespace {
std::unique_ptr<answer_file> open_xml(const temp_directory& dir, const std::string& xml) {
    std::filesystem::path path = dir.path() / "unattend.xml";
    write_file(path, xml);
    unattend_error_info error;
    std::unique_ptr<answer_file> file = answer_file::open(path, error);
    EXPECT_FALSE(error) << error.message;
    return file;
}
} // namespace

TEST(AnswerFileTest, CreatesDocumentWhenSourceIsMissing) {
    temp_directory dir;
    unattend_error_info error;
    auto file = answer_file::load_or_create(dir.path() / "missing.xml", dir.path() / "out.xml",
                                            error);
    ASSERT_NE(file.get(), nullptr);
    EXPECT_FALSE(error);

    xmlNodePtr root = file->root();
    ASSERT_NE(root, nullptr);
    EXPECT_TRUE(answer_file::is_element(root, "unattend", xml_namespace::unattend));
    EXPECT_EQ(file->target_path().string(), (dir.path() / "out.xml").string());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out.xml"));

    std::string xml = file->to_string();
    EXPECT_NE(xml.find("xmlns=\"urn:schemas-microsoft-com:unattend\""), std::string::npos);
    EXPECT_NE(xml.find("xmlns:wcm=\"http://schemas.microsoft.com/WMIConfig/2002/State\""),
              std::string::npos);
    EXPECT_NE(xml.find("xmlns:eds=\"urn:eds:unattend:extension\""), std::string::npos);
}

TEST(AnswerFileTest, SynthesizesRootForEmptyFile) {
    temp_directory dir;
    auto file = open_xml(dir, "\xEF\xBB\xBF  \r\n");
    ASSERT_NE(file.get(), nullptr);
    EXPECT_TRUE(answer_file::is_element(file->root(), "unattend", xml_namespace::unattend));
}

TEST(AnswerFileTest, RejectsMalformedDocument) {
    temp_directory dir;
    std::filesystem::path path = dir.path() / "broken.xml";
    write_file(path, "<unattend><settings></unattend>");

    unattend_error_info error;
    auto file = answer_file::open(path, error);
    EXPECT_EQ(file.get(), nullptr);
    EXPECT_EQ(error.code, unattend_error::malformed_document);
}

TEST(AnswerFileTest, AddsMissingNamespaceDeclarationsToLoadedRoot) {
    temp_directory dir;
    auto file = open_xml(dir, R"(<unattend xmlns="urn:schemas-microsoft-com:unattend"/>)");
    ASSERT_NE(file.get(), nullptr);

    std::string xml = file->to_string();
    EXPECT_NE(xml.find("xmlns:wcm="), std::string::npos);
    EXPECT_NE(xml.find("xmlns:eds="), std::string::npos);
}

TEST(AnswerFileTest, RejectsRootOutsideSetupNamespace) {
    temp_directory dir;
    std::filesystem::path path = dir.path() / "unattend.xml";
    const std::string roots[] = {
        R"(<unattend><settings pass="specialize"/></unattend>)",
        R"(<unattend xmlns="urn:example:other"><settings pass="specialize"/></unattend>)",
        R"(<answers xmlns="urn:schemas-microsoft-com:unattend"/>)",
    };

    for (const std::string& xml : roots) {
        write_file(path, xml);
        unattend_error_info error;
        auto file = answer_file::open(path, error);
        EXPECT_EQ(file.get(), nullptr) << xml;
        EXPECT_EQ(error.code, unattend_error::malformed_document) << xml;
        EXPECT_EQ(read_file(path), xml);
    }
}

TEST(AnswerFileTest, ValidTextIsUtf8WithXmlCharactersOnly) {
    EXPECT_TRUE(answer_file::is_valid_text(""));
    EXPECT_TRUE(answer_file::is_valid_text("Lab 4\r\n\tok"));
    EXPECT_TRUE(answer_file::is_valid_text("Gr\xC3\xA4\xC3\x9F" "e"));
    EXPECT_TRUE(answer_file::is_valid_text("\xF0\x9F\x98\x80"));

    // Latin-1 bytes, truncated sequence, lone surrogate.
    EXPECT_FALSE(answer_file::is_valid_text("Gr\xE4\xDF" "e"));
    EXPECT_FALSE(answer_file::is_valid_text("\xC3"));
    EXPECT_FALSE(answer_file::is_valid_text("\xED\xA0\x80"));

    // Control characters outside the XML 1.0 Char production.
    EXPECT_FALSE(answer_file::is_valid_text("a\x1b[0mb"));
    EXPECT_FALSE(answer_file::is_valid_text("page\x0c"));
    EXPECT_FALSE(answer_file::is_valid_text(std::string("nul\0byte", 8)));
    EXPECT_FALSE(answer_file::is_valid_text("\xEF\xBF\xBE"));
}

TEST(AnswerFileTest, FindOrCreateComponentIsIdempotent) {
    temp_directory dir;
    unattend_error_info error;
    auto file = answer_file::load_or_create(dir.path() / "none.xml", dir.path() / "out.xml",
                                            error);
    ASSERT_NE(file.get(), nullptr);

    xmlNodePtr first = file->find_or_create_component(passes::SPECIALIZE, components::SHELL_SETUP);
    xmlNodePtr second = file->find_or_create_component(passes::SPECIALIZE, components::SHELL_SETUP);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, file->find_component(passes::SPECIALIZE, components::SHELL_SETUP));

    EXPECT_EQ(select(*file, "//u:settings[@pass='specialize']").size(), 1u);
    EXPECT_EQ(select(*file, "//u:component[@name='Microsoft-Windows-Shell-Setup']").size(), 1u);

    EXPECT_EQ(file->attribute(first, "processorArchitecture"), "amd64");
    EXPECT_EQ(file->attribute(first, "publicKeyToken"), "31bf3856ad364e35");
    EXPECT_EQ(file->attribute(first, "language"), "neutral");
    EXPECT_EQ(file->attribute(first, "versionScope"), "nonSxS");
}

TEST(AnswerFileTest, ExistingComponentAttributesAreNotReconciled) {
    temp_directory dir;
    auto file = open_xml(dir, MINIMAL_HEADER + R"(
  <settings pass="specialize">
    <component name="Microsoft-Windows-Shell-Setup" processorArchitecture="x86"/>
  </settings>
)" + MINIMAL_FOOTER);
    ASSERT_NE(file.get(), nullptr);

    xmlNodePtr component =
        file->find_or_create_component(passes::SPECIALIZE, components::SHELL_SETUP);
    EXPECT_EQ(file->attribute(component, "processorArchitecture"), "x86");
    EXPECT_EQ(file->attribute(component, "versionScope"), "");
}

TEST(AnswerFileTest, IgnoresElementsInOtherNamespaces) {
    temp_directory dir;
    auto file = open_xml(dir, MINIMAL_HEADER + R"(
  <settings xmlns="urn:example:other" pass="specialize">
    <component name="Microsoft-Windows-Shell-Setup"/>
  </settings>
)" + MINIMAL_FOOTER);
    ASSERT_NE(file.get(), nullptr);

    EXPECT_EQ(file->find_pass(passes::SPECIALIZE), nullptr);
    EXPECT_EQ(file->find_component(passes::SPECIALIZE, components::SHELL_SETUP), nullptr);

    xmlNodePtr created = file->find_or_create_pass(passes::SPECIALIZE);
    ASSERT_NE(created, nullptr);
    EXPECT_TRUE(answer_file::is_element(created, "settings", xml_namespace::unattend));
    EXPECT_EQ(select(*file, "/u:unattend/*[local-name()='settings']").size(), 2u);
    EXPECT_EQ(select(*file, "/u:unattend/u:settings").size(), 1u);
}

TEST(AnswerFileTest, ExtensionChildrenKeepTheirNamespace) {
    temp_directory dir;
    unattend_error_info error;
    auto file = answer_file::load_or_create(dir.path() / "none.xml", dir.path() / "out.xml",
                                            error);
    ASSERT_NE(file.get(), nullptr);

    xmlNodePtr extension =
        file->find_or_create_child(file->root(), "Extension", xml_namespace::extension);
    file->set_child_text(extension, "Value", "ext", xml_namespace::extension);
    file->set_child_text(extension, "Value", "setup");

    EXPECT_EQ(select_text(*file, "/u:unattend/eds:Extension/eds:Value"), "ext");
    EXPECT_EQ(select_text(*file, "/u:unattend/eds:Extension/u:Value"), "setup");
}

TEST(AnswerFileTest, SetTextEscapesMarkup) {
    temp_directory dir;
    unattend_error_info error;
    auto file = answer_file::load_or_create(dir.path() / "none.xml", dir.path() / "out.xml",
                                            error);
    ASSERT_NE(file.get(), nullptr);

    xmlNodePtr node = file->set_child_text(file->root(), "Note", "a < b && c > &amp;");
    EXPECT_EQ(answer_file::text_of(node), "a < b && c > &amp;");
    EXPECT_NE(file->to_string().find("a &lt; b &amp;&amp; c &gt; &amp;amp;"), std::string::npos);

    file->set_child_text(file->root(), "Note", "replaced");
    EXPECT_EQ(answer_file::text_of(node), "replaced");
    EXPECT_EQ(select(*file, "/u:unattend/u:Note").size(), 1u);
}

TEST(AnswerFileTest, SaveWritesDeclarationWithoutByteOrderMark) {
    temp_directory dir;
    unattend_error_info error;
    std::filesystem::path target = dir.path() / "Temp" / "unattended.xml";
    auto file = answer_file::load_or_create(dir.path() / "none.xml", target, error);
    ASSERT_NE(file.get(), nullptr);
    file->find_or_create_component(passes::OOBE_SYSTEM, components::SHELL_SETUP);

    ASSERT_TRUE(file->save(error)) << error.message;

    std::string bytes = read_file(target);
    ASSERT_GE(bytes.size(), 3u);
    EXPECT_NE(bytes.compare(0, 3, "\xEF\xBB\xBF"), 0);
    EXPECT_EQ(bytes.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n", 0), 0u);
    EXPECT_NE(bytes.find("\n  <settings pass=\"oobeSystem\">"), std::string::npos);
    EXPECT_NE(bytes.find("\n    <component name=\"Microsoft-Windows-Shell-Setup\""),
              std::string::npos);

    // No temporary file is left behind.
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(target.parent_path())) {
        (void)entry;
        entries++;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(AnswerFileTest, SaveReportsUnwritableTarget) {
    temp_directory dir;
    std::filesystem::path blocker = dir.path() / "blocker";
    write_file(blocker, "not a directory");

    unattend_error_info error;
    auto file = answer_file::load_or_create(dir.path() / "none.xml", blocker / "unattended.xml",
                                            error);
    ASSERT_NE(file.get(), nullptr);

    EXPECT_FALSE(file->save(error));
    EXPECT_EQ(error.code, unattend_error::serialization_failure);
}

TEST(AnswerFileTest, SaveThenReloadIsLossless) {
    temp_directory dir;
    unattend_error_info error;
    std::filesystem::path target = dir.path() / "out.xml";
    auto file = answer_file::load_or_create(dir.path() / "none.xml", target, error);
    ASSERT_NE(file.get(), nullptr);

    xmlNodePtr shell = file->find_or_create_component(passes::SPECIALIZE, components::SHELL_SETUP);
    file->set_child_text(shell, "ComputerName", "LAB-01");
    xmlNodePtr account = file->append_child(
        file->find_or_create_path(shell, {"UserAccounts", "LocalAccounts"}), "LocalAccount");
    file->set_attribute(account, xml_namespace::wcm, "action", "add");
    xmlNodePtr script = file->set_child_text(
        file->find_or_create_child(file->root(), "Extension", xml_namespace::extension),
        "CopyScript", "param($Folder)\r\nif ($a -lt 1) { \"<ok>\" }\n", xml_namespace::extension);
    xmlNodeSetSpacePreserve(script, 1);
    ASSERT_TRUE(file->save(error)) << error.message;

    auto reloaded = answer_file::open(target, error);
    ASSERT_NE(reloaded.get(), nullptr);
    EXPECT_EQ(reloaded->to_string(), file->to_string());
    EXPECT_EQ(select_text(*reloaded, "//eds:CopyScript"),
              "param($Folder)\r\nif ($a -lt 1) { \"<ok>\" }\n");
    EXPECT_EQ(select_text(*reloaded, "//u:ComputerName"), "LAB-01");
    ASSERT_EQ(select(*reloaded, "//u:LocalAccount").size(), 1u);
    EXPECT_EQ(select_text(*reloaded, "//u:LocalAccount/@wcm:action"), "add");
}
