#include <gtest/gtest.h>

#include "report/EntityExtractor.hpp"
#include "report/RecordBuilder.hpp"

using namespace report;

TEST(NameExtractionTest, StructuredNameStopsAtSubject) {
    EXPECT_EQ(extract_full_name("Name: Ahmad Daniel Languages 74/100").value_or(""), "Ahmad Daniel");
    EXPECT_EQ(extract_full_name("Student Name   Siti   Aminah Binti Yusof").value_or(""), "Siti Aminah Binti Yusof");
}

TEST(NameExtractionTest, StructuredNameNeedsTwoTokens) {
    EXPECT_FALSE(extract_full_name("Name: Ahmad").has_value());
    EXPECT_FALSE(extract_full_name("Name: Ahmad Mathematics").has_value());
    EXPECT_FALSE(extract_full_name("").has_value());
}

TEST(NameExtractionTest, OcrNameAcceptsOneToken) {
    EXPECT_EQ(extract_name_from_ocr("Report\nName Mahbub English Hasan\n").value_or(""), "Mahbub");
    EXPECT_EQ(extract_name_from_ocr("Name: Arif Bin Hassan").value_or(""), "Arif Bin Hassan");
    EXPECT_FALSE(extract_name_from_ocr("Name: 12345").has_value());
}

TEST(NameExtractionTest, LooksLikeName) {
    EXPECT_TRUE(looks_like_name("Ahmad Daniel"));
    EXPECT_FALSE(looks_like_name("Ahmad"));
    EXPECT_FALSE(looks_like_name("Mathematics Science"));
}

TEST(NameExtractionTest, ColumnHeaderName) {
    EXPECT_EQ(extract_name_from_columns({"Student Name", "Ahmad Daniel Bin Hassan", "Unnamed: 2"}).value_or(""),
              "Ahmad Daniel Bin Hassan");
    EXPECT_FALSE(extract_name_from_columns({"Section", "Label", "Score"}).has_value());
    EXPECT_FALSE(extract_name_from_columns({"Unnamed Column Header"}).has_value());
}

TEST(GenderStateTest, Gender) {
    EXPECT_EQ(extract_gender("gender: female").value_or(""), "Female");
    EXPECT_EQ(extract_gender("Gender Prefer not to say").value_or(""), "Prefer Not To Say");
    EXPECT_FALSE(extract_gender("Genre: Fiction").has_value());
}

TEST(GenderStateTest, State) {
    EXPECT_EQ(extract_state("State Selangor").value_or(""), "Selangor");
    EXPECT_EQ(extract_state("State Negeri\nSembilan").value_or(""), "Negeri Sembilan");
    EXPECT_EQ(extract_state("state: NEGERI").value_or(""), "Negeri Sembilan");
    EXPECT_EQ(extract_state("State: Kuala Lumpur").value_or(""), "Kuala Lumpur");
    EXPECT_EQ(extract_state("State Selangor Gender Male").value_or(""), "Selangor");
    EXPECT_FALSE(extract_state("Country Malaysia").has_value());

    // the cue is a whole word and the state is capitalized
    EXPECT_FALSE(extract_state("Statement of Results").has_value());
    EXPECT_FALSE(extract_state("the state of mind").has_value());
    EXPECT_EQ(extract_state("Statement of Results\nState: Perak").value_or(""), "Perak");
}

TEST(InlineMetadataTest, MixedLineLeavesScoreInRemainder) {
    const InlineMetadata md = parse_metadata_line("Name Arif Bin Hassan Languages 74/100");
    ASSERT_EQ(md.fields.size(), 1u);
    EXPECT_EQ(md.fields[0].first, "Student Name");
    EXPECT_EQ(md.fields[0].second, "Arif Bin Hassan");
    EXPECT_EQ(md.remainder, "Languages 74/100");
}

TEST(InlineMetadataTest, SchoolLevelStopsAtForm) {
    const InlineMetadata md = parse_metadata_line("School Level: Secondary (High School) Form: Form 4");
    ASSERT_EQ(md.fields.size(), 2u);
    EXPECT_EQ(md.fields[0].first, "School Level");
    EXPECT_EQ(md.fields[0].second, "Secondary (High School)");
    EXPECT_EQ(md.fields[1].first, "Form");
    EXPECT_EQ(md.fields[1].second, "Form 4");
}

TEST(InlineMetadataTest, GenderAndNationality) {
    const InlineMetadata md = parse_metadata_line("Gender: Male Nationality: Malaysian");
    ASSERT_EQ(md.fields.size(), 2u);
    EXPECT_EQ(md.fields[0].second, "Male");
    EXPECT_EQ(md.fields[1].first, "Nationality");
    EXPECT_EQ(md.fields[1].second, "Malaysian");
    EXPECT_EQ(md.remainder, "");
}

TEST(CertificateNameTest, NameOnTheLineAfterTheCue) {
    const std::string text =
        "Certificate of Completion\n"
        "This certificate is presented to\n"
        "Helene Paquet\n"
        "for completing the course on data analysis\n";
    EXPECT_EQ(extract_certificate_name(text).value_or(""), "Helene Paquet");
}

TEST(CertificateNameTest, InlineCueAndLetterSpacing) {
    EXPECT_EQ(extract_certificate_name("This certifies that John Smith has completed the course").value_or(""),
              "John Smith");
    EXPECT_EQ(extract_certificate_name("presented to\nH e l e n e Paquet\n").value_or(""), "Helene Paquet");
}

TEST(CertificateNameTest, AllCapsFallbackSkipsHeadings) {
    const std::string text = "CERTIFICATE OF COMPLETION\nJOHN SMITH\nfor outstanding work\n";
    EXPECT_EQ(extract_certificate_name(text).value_or(""), "John Smith");
}

TEST(MetadataAssemblyTest, ColumnHeaderOutranksRows) {
    SourceTable src;
    src.columns = {"Student Name", "Nur Aisyah Binti Ali"};
    src.metadata = {{"Student Name", "Ahmad Daniel"}, {"Gender", "Female"}, {"Form", "Form 4"}};

    const StudentMetadata md = extract_student_metadata(src, {}, "");
    EXPECT_EQ(md.name.value_or(""), "Nur Aisyah Binti Ali");
    ASSERT_TRUE(md.gender.has_value());
    EXPECT_EQ(*md.gender, Gender::Female);
    ASSERT_NE(md.field("Form"), nullptr);
    EXPECT_EQ(*md.field("Form"), "Form 4");
}

TEST(MetadataAssemblyTest, FromClassifiedLines) {
    const CanonicalTable t = normalize_text("Student Details\nName: Ahmad Daniel\nGender: Male\nState: Selangor\n");
    const StudentMetadata md = extract_student_metadata(SourceTable{}, t, "");

    EXPECT_EQ(md.name.value_or(""), "Ahmad Daniel");
    ASSERT_TRUE(md.gender.has_value());
    EXPECT_EQ(*md.gender, Gender::Male);
    EXPECT_EQ(md.state.value_or(""), "Selangor");
}

TEST(MetadataAssemblyTest, FirstMatchWinsAndUndisclosedGenderIsAField) {
    SourceTable src;
    src.metadata = {{"Gender", "Prefer not to say"}, {"State", "Johor"}};
    const std::string text = "Gender: Male\nState: Perak\n";

    const StudentMetadata md = extract_student_metadata(src, {}, text);
    EXPECT_FALSE(md.gender.has_value());
    ASSERT_NE(md.field("Gender"), nullptr);
    EXPECT_EQ(*md.field("Gender"), "Prefer Not To Say");
    EXPECT_EQ(md.state.value_or(""), "Johor");
}

TEST(MetadataAssemblyTest, NothingFound) {
    EXPECT_TRUE(extract_student_metadata(SourceTable{}, {}, "").empty());
}
