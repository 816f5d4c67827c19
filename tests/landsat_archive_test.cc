#include "openmtl/landsat_archive.h"
#include "openmtl/resource_policy.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace openmtl {

static void
write_scene_dir(const test::ScratchDir& dir)
{
    ASSERT_TRUE(test::write_file(dir.str("scene_MTL.txt"),
                                 test::landsat8_mtl()));
    ASSERT_TRUE(test::write_file(dir.str("scene_B1.TIF"), "b1"));
    ASSERT_TRUE(test::write_file(dir.str("scene_B4.TIF"), "b4"));
    ASSERT_TRUE(test::write_file(dir.str("scene_BQA.TIF"), "bqa"));
}


TEST(LandsatArchiveTest, ReadsSceneDirectory)
{
    test::ScratchDir dir;
    write_scene_dir(dir);

    LandsatReadOptions options;
    options.alias = "my scene";
    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(dir.str(), options,
                                                       &scene);
    ASSERT_EQ(res.status, LandsatStatus::Ok);
    EXPECT_EQ(res.stage, LandsatStage::BandIndexReady);
    EXPECT_EQ(res.sensor_key, "LANDSAT_8_OLI_TIRS");

    EXPECT_EQ(std::filesystem::path(scene.source_dir()), dir.path());
    EXPECT_EQ(scene.alias(), "my scene");
    EXPECT_EQ(scene.sensor().key, "LANDSAT_8_OLI_TIRS");
    ASSERT_NE(scene.mapping(), nullptr);
    EXPECT_EQ(scene.bands().size(), 3U);
    EXPECT_EQ(scene.metadata().get("PRODUCT_METADATA", "WRS_PATH")->as_int(),
              44);

    std::string_view file;
    ASSERT_EQ(scene.resolve_band("red", &file), BandStatus::Ok);
    EXPECT_EQ(file, "scene_B4.TIF");
    ASSERT_EQ(scene.resolve_band(4U, &file), BandStatus::Ok);
    EXPECT_EQ(file, "scene_B4.TIF");
    ASSERT_EQ(scene.resolve_band("QUALITY", &file), BandStatus::Ok);
    EXPECT_EQ(file, "scene_BQA.TIF");
    EXPECT_EQ(scene.resolve_band(7U, &file), BandStatus::BandNotFound);

    std::string path;
    ASSERT_EQ(scene.band_path("coastal", &path), BandStatus::Ok);
    EXPECT_EQ(std::filesystem::path(path), dir.path() / "scene_B1.TIF");
    EXPECT_EQ(test::read_file(path), "b1");
    EXPECT_EQ(scene.band_path("swir2", &path), BandStatus::BandNotFound);
}


TEST(LandsatArchiveTest, ReadsStandaloneMetadataFile)
{
    test::ScratchDir dir;
    write_scene_dir(dir);

    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(
        dir.str("scene_MTL.txt"), LandsatReadOptions {}, &scene);
    ASSERT_EQ(res.status, LandsatStatus::Ok);
    EXPECT_EQ(scene.resolved().kind, SourceKind::MetadataFile);
    EXPECT_EQ(std::filesystem::path(scene.source_dir()), dir.path());
}


TEST(LandsatArchiveTest, ReadsZipArchive)
{
    test::ScratchDir dir;
    const std::string archive = dir.str("LC08_SCENE.zip");
    ASSERT_TRUE(test::write_file(
        archive,
        test::build_zip({ { "LC08_SCENE/scene_MTL.txt", test::landsat8_mtl() },
                          { "LC08_SCENE/scene_B4.TIF", "b4" } })));

    LandsatReadOptions options;
    options.extract_to = dir.str("extracted");
    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(archive, options,
                                                       &scene);
    ASSERT_EQ(res.status, LandsatStatus::Ok);
    EXPECT_EQ(scene.resolved().archive_format, ArchiveFormat::Zip);
    EXPECT_EQ(std::filesystem::path(scene.source_dir()),
              dir.path() / "extracted" / "LC08_SCENE");

    std::string path;
    ASSERT_EQ(scene.band_path("red", &path), BandStatus::Ok);
    EXPECT_EQ(test::read_file(path), "b4");
}


TEST(LandsatArchiveTest, ReadsTarArchiveTwice)
{
    test::ScratchDir dir;
    const std::string archive = dir.str("scene.tar");
    ASSERT_TRUE(test::write_file(
        archive, test::build_tar({ { "scene_MTL.txt", test::landsat8_mtl() },
                                   { "scene_B4.TIF", "b4" } })));

    LandsatArchive first;
    ASSERT_EQ(LandsatArchive::read(archive, LandsatReadOptions {}, &first)
                  .status,
              LandsatStatus::Ok);
    LandsatArchive second;
    ASSERT_EQ(LandsatArchive::read(archive, LandsatReadOptions {}, &second)
                  .status,
              LandsatStatus::Ok);

    EXPECT_EQ(std::filesystem::path(first.source_dir()), dir.path() / "scene");
    ASSERT_EQ(first.metadata().group_count(), second.metadata().group_count());
    for (const MtlRecord& rec : first.metadata().records()) {
        const MtlRecord* other = second.metadata().get(rec.group);
        ASSERT_NE(other, nullptr);
        ASSERT_EQ(other->fields.size(), rec.fields.size());
        for (size_t i = 0; i < rec.fields.size(); ++i) {
            EXPECT_EQ(other->fields[i].key, rec.fields[i].key);
            EXPECT_TRUE(other->fields[i].value == rec.fields[i].value);
        }
    }
}


#if defined(OPENMTL_HAS_BZIP2) && OPENMTL_HAS_BZIP2
TEST(LandsatArchiveTest, ReadsBzip2TarArchive)
{
    test::ScratchDir dir;
    const std::string archive = dir.str("scene.tar.bz2");
    ASSERT_TRUE(test::write_file(
        archive,
        test::bzip2_bytes(test::build_tar(
            { { "scene_MTL.txt", test::landsat8_mtl() },
              { "scene_B4.TIF", "b4" } }))));

    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(
        archive, LandsatReadOptions {}, &scene);
    ASSERT_EQ(res.status, LandsatStatus::Ok);
    EXPECT_EQ(scene.resolved().archive_format, ArchiveFormat::TarBzip2);
    EXPECT_EQ(std::filesystem::path(scene.source_dir()), dir.path() / "scene");

    std::string path;
    ASSERT_EQ(scene.band_path("red", &path), BandStatus::Ok);
    EXPECT_EQ(test::read_file(path), "b4");
}
#endif

#if defined(OPENMTL_HAS_LZMA) && OPENMTL_HAS_LZMA
TEST(LandsatArchiveTest, ReadsXzTarArchive)
{
    test::ScratchDir dir;
    const std::string archive = dir.str("scene.tar.xz");
    ASSERT_TRUE(test::write_file(
        archive,
        test::xz_bytes(test::build_tar(
            { { "scene_MTL.txt", test::landsat8_mtl() },
              { "scene_B4.TIF", "b4" } }))));

    LandsatArchive scene;
    ASSERT_EQ(LandsatArchive::read(archive, LandsatReadOptions {}, &scene)
                  .status,
              LandsatStatus::Ok);
    EXPECT_EQ(scene.resolved().archive_format, ArchiveFormat::TarXz);

    std::string_view file_name;
    ASSERT_EQ(scene.resolve_band(4U, &file_name), BandStatus::Ok);
    EXPECT_EQ(file_name, "scene_B4.TIF");
}
#endif


TEST(LandsatArchiveTest, QuotedGroupTagsIdentifySensor)
{
    test::ScratchDir dir;
    const std::string path = dir.str("scene_MTL.txt");
    ASSERT_TRUE(test::write_file(path,
                                 "GROUP = \"PRODUCT_METADATA\"\n"
                                 "  SPACECRAFT_ID = \"LANDSAT_8\"\n"
                                 "  SENSOR_ID = \"OLI_TIRS\"\n"
                                 "  FILE_NAME_BAND_4 = \"scene_B4.TIF\"\n"
                                 "END_GROUP = \"PRODUCT_METADATA\"\n"
                                 "END\n"));

    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(
        path, LandsatReadOptions {}, &scene);
    ASSERT_EQ(res.status, LandsatStatus::Ok);
    EXPECT_EQ(res.sensor_key, "LANDSAT_8_OLI_TIRS");

    std::string_view file_name;
    ASSERT_EQ(scene.resolve_band("red", &file_name), BandStatus::Ok);
    EXPECT_EQ(file_name, "scene_B4.TIF");
}


TEST(LandsatArchiveTest, FailureLeavesTargetUntouched)
{
    test::ScratchDir dir;
    write_scene_dir(dir);

    LandsatArchive scene;
    ASSERT_EQ(LandsatArchive::read(dir.str(), LandsatReadOptions {}, &scene)
                  .status,
              LandsatStatus::Ok);

    const LandsatReadResult res = LandsatArchive::read(
        dir.str("missing"), LandsatReadOptions {}, &scene);
    EXPECT_EQ(res.status, LandsatStatus::UnsupportedSource);
    EXPECT_EQ(res.stage, LandsatStage::Unresolved);
    EXPECT_EQ(scene.bands().size(), 3U);
}


TEST(LandsatArchiveTest, ReportsStageOfFailure)
{
    test::ScratchDir dir;

    {
        LandsatArchive scene;
        const LandsatReadResult res = LandsatArchive::read(
            dir.str(), LandsatReadOptions {}, &scene);
        EXPECT_EQ(res.status, LandsatStatus::MetadataFileMissing);
        EXPECT_EQ(res.stage, LandsatStage::Unresolved);
    }

    ASSERT_TRUE(test::write_file(dir.str("bad_MTL.txt"),
                                 "GROUP = A\n  X = 1\nEND_GROUP = B\n"));
    {
        LandsatArchive scene;
        const LandsatReadResult res = LandsatArchive::read(
            dir.str("bad_MTL.txt"), LandsatReadOptions {}, &scene);
        EXPECT_EQ(res.status, LandsatStatus::ParseFailed);
        EXPECT_EQ(res.stage, LandsatStage::MetadataLocated);
        EXPECT_EQ(res.parse.status, MtlParseStatus::DivergingTags);
        EXPECT_EQ(res.parse.line, 3U);
    }

    ASSERT_TRUE(test::write_file(dir.str("anon_MTL.txt"),
                                 "GROUP = PRODUCT_METADATA\n"
                                 "  DATA_TYPE = \"L1T\"\n"
                                 "  WRS_PATH = 1\n"
                                 "END_GROUP = PRODUCT_METADATA\n"));
    {
        LandsatArchive scene;
        const LandsatReadResult res = LandsatArchive::read(
            dir.str("anon_MTL.txt"), LandsatReadOptions {}, &scene);
        EXPECT_EQ(res.status, LandsatStatus::SensorIdentityMissing);
        EXPECT_EQ(res.stage, LandsatStage::MetadataLocated);
    }

    ASSERT_TRUE(test::write_file(dir.str("s2_MTL.txt"),
                                 "GROUP = PRODUCT_METADATA\n"
                                 "  SPACECRAFT_ID = \"SENTINEL_2A\"\n"
                                 "  SENSOR_ID = \"MSI\"\n"
                                 "END_GROUP = PRODUCT_METADATA\n"));
    {
        LandsatArchive scene;
        const LandsatReadResult res = LandsatArchive::read(
            dir.str("s2_MTL.txt"), LandsatReadOptions {}, &scene);
        EXPECT_EQ(res.status, LandsatStatus::BandMapMissing);
        EXPECT_EQ(res.stage, LandsatStage::SensorIdentified);
        EXPECT_EQ(res.sensor_key, "SENTINEL_2A_MSI");
    }
}


TEST(LandsatArchiveTest, AppliesResourcePolicy)
{
    test::ScratchDir dir;
    write_scene_dir(dir);

    OpenMtlResourcePolicy policy;
    policy.parse_limits.max_file_bytes = 64;
    LandsatReadOptions options;
    apply_resource_policy(policy, &options);
    EXPECT_EQ(options.parse_limits.max_file_bytes, 64U);

    LandsatArchive scene;
    const LandsatReadResult res = LandsatArchive::read(dir.str(), options,
                                                       &scene);
    EXPECT_EQ(res.status, LandsatStatus::LimitExceeded);
    EXPECT_EQ(res.parse.status, MtlParseStatus::LimitExceeded);
}


TEST(LandsatArchiveTest, CustomPatternSelectsMetadataFile)
{
    test::ScratchDir dir;
    write_scene_dir(dir);
    ASSERT_TRUE(test::write_file(dir.str("scene_MTL.txt"), "garbage"));
    ASSERT_TRUE(test::write_file(dir.str("scene_metadata.txt"),
                                 test::landsat8_mtl()));

    LandsatReadOptions options;
    options.metadata_pattern = R"(.*_metadata\.txt)";
    LandsatArchive scene;
    ASSERT_EQ(LandsatArchive::read(dir.str(), options, &scene).status,
              LandsatStatus::Ok);
    EXPECT_EQ(std::filesystem::path(scene.resolved().metadata_path),
              dir.path() / "scene_metadata.txt");

    options.metadata_pattern = "(";
    EXPECT_EQ(LandsatArchive::read(dir.str(), options, &scene).status,
              LandsatStatus::InvalidPattern);
}

}  // namespace openmtl
