#include <gtest/gtest.h>
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "EntryStore.hpp"
#include "DebugFormat.hpp"

using namespace XdgEntry;
using namespace std::string_literals;

namespace {

using Names = std::vector<std::string_view>;

Names Sorted(Names names)
{
	std::sort(names.begin(), names.end());
	return names;
}

std::optional<std::string_view> Text(const char* text)
{
	return std::string_view(text);
}

EntryStore MustBuild(std::string data)
{
	ParseError error;
	auto store = EntryStore::Build(std::move(data), &error);
	EXPECT_TRUE(store.has_value()) << error.Describe();
	return std::move(store).value();
}

bool PointsInto(std::string_view view, std::string_view buffer)
{
	return view.data() >= buffer.data() && view.data() + view.size() <= buffer.data() + buffer.size();
}

} // namespace


// ============================================================================
// Scenarios
// ============================================================================

TEST(EntryStoreTest, DesktopEntry)
{
	auto store = MustBuild("[Desktop Entry]\nName=Firefox\nExec=firefox %u\nIcon=firefox");
	EXPECT_EQ(store.SectionNames(), Names({"Desktop Entry"}));
	EXPECT_EQ(Sorted(store.AttributeNames("Desktop Entry").value()), Names({"Exec", "Icon", "Name"}));
	EXPECT_EQ(store.Get("Desktop Entry", "Name"), Text("Firefox"));
	EXPECT_EQ(store.Get("Desktop Entry", "Exec"), Text("firefox %u"));
	EXPECT_EQ(store.Get("Desktop Entry", "Icon"), Text("firefox"));
	for (auto name : {"Name", "Exec", "Icon"}) {
		EXPECT_FALSE(store.ParameterKeys("Desktop Entry", name).has_value()) << name;
	}
}

TEST(EntryStoreTest, IconThemeDirectory)
{
	auto store = MustBuild("[apps]\nSize=48\nScale=1");
	EXPECT_EQ(store.SectionNames(), Names({"apps"}));
	EXPECT_EQ(store.AttributeNames("apps").value().size(), 2u);
	EXPECT_EQ(store.Get("apps", "Size"), Text("48"));
	EXPECT_EQ(store.Get("apps", "Scale"), Text("1"));
}

TEST(EntryStoreTest, NoHeaderBuildsEmptyStore)
{
	auto store = MustBuild("Size=48\nScale=1");
	EXPECT_EQ(store.SectionCount(), 0u);
	EXPECT_TRUE(store.SectionNames().empty());
	EXPECT_FALSE(store.Get("apps", "Size").has_value());
}

TEST(EntryStoreTest, RoundTripOfPlainAttribute)
{
	auto store = MustBuild("[Service]\nExecStart=/usr/bin/sshd -D\n");
	EXPECT_EQ(store.Get("Service", "ExecStart"), Text("/usr/bin/sshd -D"));
}

TEST(EntryStoreTest, ParameterExtraction)
{
	auto store = MustBuild("[Desktop Entry]\nName[ast]=Restolador Web");
	EXPECT_EQ(store.Get("Desktop Entry", "Name", "ast"), Text("Restolador Web"));
	EXPECT_EQ(store.ParameterKeys("Desktop Entry", "Name").value(), Names({"ast"}));
	EXPECT_FALSE(store.Get("Desktop Entry", "Name[ast]").has_value());
}

TEST(EntryStoreTest, CommentAndWhitespaceAreTransparent)
{
	auto noisy = MustBuild("[S]\n  \t\n# comment\nK=V");
	auto plain = MustBuild("[S]\nK=V");
	EXPECT_EQ(noisy.SectionNames(), plain.SectionNames());
	EXPECT_EQ(noisy.AttributeNames("S"), plain.AttributeNames("S"));
	EXPECT_EQ(noisy.Get("S", "K"), plain.Get("S", "K"));
	EXPECT_EQ(noisy.Get("S", "K"), Text("V"));
}


// ============================================================================
// Merging
// ============================================================================

TEST(EntryStoreMergeTest, PlainThenParameter)
{
	auto store = MustBuild("[S]\nA=X\nA[p]=Y");
	EXPECT_EQ(store.Get("S", "A"), Text("X"));
	EXPECT_EQ(store.Get("S", "A", "p"), Text("Y"));
	EXPECT_EQ(store.AttributeNames("S").value(), Names({"A"}));
}

TEST(EntryStoreMergeTest, ParameterThenPlain)
{
	auto store = MustBuild("[S]\nA[p]=Y\nA=X");
	EXPECT_EQ(store.Get("S", "A"), Text("X"));
	EXPECT_EQ(store.Get("S", "A", "p"), Text("Y"));
	EXPECT_EQ(store.AttributeNames("S").value(), Names({"A"}));
}

TEST(EntryStoreMergeTest, LastPlainValueWins)
{
	auto store = MustBuild("[S]\nA=X\nA=Z");
	EXPECT_EQ(store.Get("S", "A"), Text("Z"));
}

TEST(EntryStoreMergeTest, LastParameterValueWins)
{
	auto store = MustBuild("[S]\nA[p]=1\nA[q]=2\nA[p]=3");
	EXPECT_EQ(store.Get("S", "A", "p"), Text("3"));
	EXPECT_EQ(store.Get("S", "A", "q"), Text("2"));
	EXPECT_EQ(Sorted(store.ParameterKeys("S", "A").value()), Names({"p", "q"}));
}

TEST(EntryStoreMergeTest, SameNameInDifferentSectionsStaysApart)
{
	auto store = MustBuild("[a]\nK=1\n[b]\nK=2");
	EXPECT_EQ(store.Get("a", "K"), Text("1"));
	EXPECT_EQ(store.Get("b", "K"), Text("2"));
}

TEST(EntryStoreMergeTest, RepeatedSectionReplacesEarlierOne)
{
	auto store = MustBuild("[S]\nA=1\n[S]\nB=2");
	EXPECT_EQ(store.SectionCount(), 1u);
	EXPECT_FALSE(store.HasAttribute("S", "A"));
	EXPECT_EQ(store.Get("S", "B"), Text("2"));
}


// ============================================================================
// Absence
// ============================================================================

TEST(EntryStoreAbsenceTest, LookupsNeverFail)
{
	auto store = MustBuild("[S]\nPlain=1\nLocalized[de]=2");

	EXPECT_FALSE(store.Get("Missing", "Plain").has_value());
	EXPECT_FALSE(store.Get("S", "Missing").has_value());
	EXPECT_FALSE(store.Get("S", "Plain", "de").has_value());
	EXPECT_FALSE(store.Get("S", "Localized", "fr").has_value());
	EXPECT_FALSE(store.Get("S", "Localized").has_value());

	EXPECT_TRUE(store.HasSection("S"));
	EXPECT_FALSE(store.HasSection("s"));
	EXPECT_TRUE(store.HasAttribute("S", "Localized"));
	EXPECT_FALSE(store.HasAttribute("S", "Localized[de]"));
	EXPECT_FALSE(store.HasAttribute("Missing", "Plain"));
	EXPECT_TRUE(store.HasParameter("S", "Localized", "de"));
	EXPECT_FALSE(store.HasParameter("S", "Plain", "de"));

	EXPECT_FALSE(store.AttributeNames("Missing").has_value());
	EXPECT_FALSE(store.ParameterKeys("Missing", "Plain").has_value());
	EXPECT_FALSE(store.ParameterKeys("S", "Missing").has_value());
	EXPECT_FALSE(store.ParameterKeys("S", "Plain").has_value());
}

TEST(EntryStoreAbsenceTest, EmptyValueIsPresent)
{
	auto store = MustBuild("[S]\nEmpty=");
	EXPECT_EQ(store.Get("S", "Empty"), Text(""));
}


// ============================================================================
// Build failures
// ============================================================================

TEST(EntryStoreBuildTest, SectionWithoutAttributesIsRejected)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[S]\n", &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::Structural);
	EXPECT_EQ(error.GetStage(), ParseError::Stage::AttributeList);
}

TEST(EntryStoreBuildTest, OneBadSectionRejectsEverything)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[Good]\nA=1\n[Bad]\nno equal sign\n", &error).has_value());
	EXPECT_EQ(error.GetStage(), ParseError::Stage::Attribute);
	EXPECT_EQ(error.Remaining(), "no equal sign\n");
}

TEST(EntryStoreBuildTest, TruncatedHeader)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[Unit]\nDescription=x\n[Serv", &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::Incomplete);
}

TEST(EntryStoreBuildTest, InvalidUtf8Value)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[S]\nK=\xff\xfe\nL=ok"s, &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::InvalidUtf8);
	EXPECT_EQ(error.Remaining(), "\xff\xfe"s);
}

TEST(EntryStoreBuildTest, InvalidUtf8Title)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[\xc3]\nK=V"s, &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::InvalidUtf8);
	EXPECT_EQ(error.Remaining(), "\xc3"s);
}

TEST(EntryStoreBuildTest, InvalidUtf8ParameterKey)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[S]\nName[\xe2\x82]=V"s, &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::InvalidUtf8);
	EXPECT_EQ(error.Remaining(), "\xe2\x82"s);
}

TEST(EntryStoreBuildTest, EmbeddedNulIsText)
{
	auto store = MustBuild("[S]\nK=a\0b\n"s);
	EXPECT_EQ(store.Get("S", "K"), std::optional<std::string_view>("a\0b"s));
}

TEST(EntryStoreBuildTest, StructuralErrorWinsOverInvalidText)
{
	ParseError error;
	EXPECT_FALSE(EntryStore::Build("[S]\nK=\xff\n[T]\nno equals\n"s, &error).has_value());
	EXPECT_EQ(error.GetKind(), ParseError::Kind::Structural);
	EXPECT_EQ(error.GetStage(), ParseError::Stage::Attribute);
	EXPECT_EQ(error.Remaining(), "no equals\n");
}

TEST(EntryStoreBuildTest, MultibyteTextIsAccepted)
{
	auto store = MustBuild("[Desktop Entry]\nName[de]=Neues Fenster öffnen\nName[ar]=متصفح ويب");
	EXPECT_EQ(store.Get("Desktop Entry", "Name", "de"), Text("Neues Fenster öffnen"));
	EXPECT_EQ(store.Get("Desktop Entry", "Name", "ar"), Text("متصفح ويب"));
}

TEST(EntryStoreBuildTest, NullErrorIsAllowed)
{
	EXPECT_FALSE(EntryStore::Build("[S]\n").has_value());
}


// ============================================================================
// Ownership
// ============================================================================

TEST(EntryStoreOwnershipTest, ViewsPointIntoOwnedBuffer)
{
	auto store = MustBuild("[Unit]\nDescription=OpenSSH Daemon\nAfter[x]=network.target");
	auto value = store.Get("Unit", "Description");
	ASSERT_TRUE(value.has_value());
	EXPECT_TRUE(PointsInto(*value, store.Data()));
	EXPECT_TRUE(PointsInto(store.Get("Unit", "After", "x").value(), store.Data()));
	for (auto name : store.SectionNames()) {
		EXPECT_TRUE(PointsInto(name, store.Data()));
	}
}

TEST(EntryStoreOwnershipTest, MoveKeepsIndexValid)
{
	// Short enough to sit in the small-string buffer, which is copied rather than handed over on move.
	auto source = MustBuild("[S]\nK=V");
	EntryStore moved = std::move(source);
	EXPECT_EQ(moved.Get("S", "K"), Text("V"));
	EXPECT_TRUE(PointsInto(moved.Get("S", "K").value(), moved.Data()));

	std::vector<EntryStore> stores;
	stores.push_back(std::move(moved));
	stores.push_back(MustBuild("[T]\nA=B"));
	EXPECT_EQ(stores[0].Get("S", "K"), Text("V"));
	EXPECT_EQ(stores[1].Get("T", "A"), Text("B"));
}

TEST(EntryStoreOwnershipTest, CopyResolvesAgainstItsOwnBuffer)
{
	auto source = MustBuild("[Section]\nKey=Value that is long enough to live on the heap");
	EntryStore copy = source;
	auto copied_value = copy.Get("Section", "Key");
	ASSERT_TRUE(copied_value.has_value());
	EXPECT_EQ(*copied_value, source.Get("Section", "Key").value());
	EXPECT_TRUE(PointsInto(*copied_value, copy.Data()));
	EXPECT_FALSE(PointsInto(*copied_value, source.Data()));
}
