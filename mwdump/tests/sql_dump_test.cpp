#include "mwdump/sql_dump.h"
#include <cstdint>
#include <string>
#include <vector>
#include "wbl/file.h"
#include "wbl/gzip_file.h"
#include "wbl/log.h"
#include "wbl/tempfile.h"
#include "wbl/unittest.h"

using std::string;
using std::vector;

namespace mwd {

const char DUMP_HEADER[] = R"(-- MySQL dump 10.19  Distrib 10.3.38-MariaDB
/*!40101 SET NAMES binary*/;
DROP TABLE IF EXISTS `page`;
CREATE TABLE `page` (
  `page_id` int(8) unsigned NOT NULL AUTO_INCREMENT,
  `page_namespace` int(11) NOT NULL,
  `page_title` varbinary(255) NOT NULL,
  PRIMARY KEY (`page_id`)
) ENGINE=InnoDB DEFAULT CHARSET=binary;
LOCK TABLES `page` WRITE;
)";

class SqlDumpTest : public wbl::Test {
private:
  string writeDump(const string& name, const string& content) {
    string path = m_tempDir.path() + "/" + name;
    wbl::writeGzipFile(path, content);
    return path;
  }

  // Reads all rows and formats them as "value|value|...;" with S for strings, N for NULL and D for decimals.
  string readAll(SqlDumpReader& reader) {
    string result;
    SqlRow row;
    while (reader.next(row)) {
      for (size_t i = 0; i < row.size(); i++) {
        if (i > 0) result += '|';
        switch (row[i].type()) {
          case SqlValue::NULL_VALUE:
            result += "N";
            break;
          case SqlValue::INTEGER:
            result += std::to_string(row[i].asInt64());
            break;
          case SqlValue::DECIMAL:
            result += "D" + row[i].str();
            break;
          case SqlValue::STRING:
            result += "S" + row[i].str();
            break;
        }
      }
      result += ';';
    }
    return result;
  }

  WBL_TEST_CASE(simpleInserts) {
    string path = writeDump("page.sql.gz", string(DUMP_HEADER) +
                                               "INSERT INTO `page` VALUES (1,0,'Main_Page'),(10,6,'Cat1.jpg');\n"
                                               "INSERT INTO `page` VALUES (11,14,'Cats');\n"
                                               "UNLOCK TABLES;\n");
    SqlDumpReader reader(path, "page");
    WBL_ASSERT_EQ(readAll(reader), "1|0|SMain_Page;10|6|SCat1.jpg;11|14|SCats;");
    WBL_ASSERT_EQ(reader.rowsRead(), 3);
    WBL_ASSERT_EQ(reader.malformedRows(), 0);
    WBL_ASSERT_EQ(reader.statementsRead(), 2);
  }

  WBL_TEST_CASE(valueTypes) {
    string path = writeDump("types.sql.gz", "INSERT INTO `t` VALUES (NULL,-5,0.25,1e5,'',+7);\n");
    SqlDumpReader reader(path, "t");
    WBL_ASSERT_EQ(readAll(reader), "N|-5|D0.25|D1e5|S|7;");
  }

  WBL_TEST_CASE(escapes) {
    string path = writeDump("escapes.sql.gz",
                            R"(INSERT INTO `t` VALUES ('l\'arbre','a\\b','say \"hi\"','x\ny','it''s','50\%','a\_b');)"
                            "\n");
    SqlDumpReader reader(path, "t");
    SqlRow row;
    WBL_ASSERT(reader.next(row));
    WBL_ASSERT_EQ(row.size(), 7u);
    WBL_ASSERT_EQ(row[0].str(), "l'arbre");
    WBL_ASSERT_EQ(row[1].str(), "a\\b");
    WBL_ASSERT_EQ(row[2].str(), "say \"hi\"");
    WBL_ASSERT_EQ(row[3].str(), "x\ny");
    WBL_ASSERT_EQ(row[4].str(), "it's");
    WBL_ASSERT_EQ(row[5].str(), "50\\%");
    WBL_ASSERT_EQ(row[6].str(), "a\\_b");
    WBL_ASSERT(!reader.next(row));
  }

  WBL_TEST_CASE(specialCharactersInStrings) {
    string path = writeDump("special.sql.gz", "INSERT INTO `t` VALUES (1,'a),(b'),(2,'c;'),(3,'d, e');\n");
    SqlDumpReader reader(path, "t");
    WBL_ASSERT_EQ(readAll(reader), "1|Sa),(b;2|Sc;;3|Sd, e;");
  }

  WBL_TEST_CASE(otherTablesAreIgnored) {
    string path = writeDump("mixed.sql.gz",
                            "INSERT INTO `page_props` VALUES (1,'x','y');\n"
                            "INSERT INTO `pagelinks` VALUES (2,0,'z');\n"
                            "INSERT INTO `page` VALUES (3,6,'A.jpg');\n"
                            "-- INSERT INTO `page` VALUES (4,6,'Commented.jpg');\n");
    SqlDumpReader reader(path, "page");
    WBL_ASSERT_EQ(readAll(reader), "3|6|SA.jpg;");
  }

  WBL_TEST_CASE(statementOnSeveralLines) {
    string path = writeDump("multiline.sql.gz", "INSERT INTO `t` VALUES (1,'a'),\n(2,'b'),\n(3,'c');\nINSERT INTO `t` "
                                                "VALUES (4,'d');\n");
    SqlDumpReader reader(path, "t");
    WBL_ASSERT_EQ(readAll(reader), "1|Sa;2|Sb;3|Sc;4|Sd;");
    WBL_ASSERT_EQ(reader.statementsRead(), 2);
  }

  WBL_TEST_CASE(unbalancedQuote) {
    string path = writeDump("linktarget.sql.gz", "INSERT INTO `linktarget` VALUES (1,14,'Cats'),(2,14,'Dogs');\n"
                                                 "INSERT INTO `linktarget` VALUES (3,14,'Bad),(4,14,'Good'),"
                                                 "(5,14,'Birds');\n"
                                                 "INSERT INTO `linktarget` VALUES (6,14,'Fish');\n");
    SqlDumpReader reader(path, "linktarget");
    WBL_ASSERT_EQ(readAll(reader), "1|14|SCats;2|14|SDogs;4|14|SGood;5|14|SBirds;6|14|SFish;");
    WBL_ASSERT_EQ(reader.malformedRows(), 1);
  }

  WBL_TEST_CASE(malformedTuples) {
    string path = writeDump("malformed.sql.gz",
                            "INSERT INTO `t` VALUES (1,'a'),(2,abc),(3,'c')),(4,'d'),(5,'unterminated);\n"
                            "INSERT INTO `t` VALUES (6,'f'),(7,99999999999999999999);\n"
                            "INSERT INTO `t` VALUES (8,'h'),(9,'i'");
    SqlDumpReader reader(path, "t");
    WBL_ASSERT_EQ(readAll(reader), "1|Sa;4|Sd;6|Sf;8|Sh;");
    WBL_ASSERT_EQ(reader.malformedRows(), 5);
  }

  WBL_TEST_CASE(rewind) {
    string path = writeDump("rewind.sql.gz", "INSERT INTO `t` VALUES (1),(2);\n");
    SqlDumpReader reader(path, "t");
    WBL_ASSERT_EQ(readAll(reader), "1;2;");
    reader.rewind();
    WBL_ASSERT_EQ(reader.rowsRead(), 0);
    WBL_ASSERT_EQ(readAll(reader), "1;2;");
  }

  WBL_TEST_CASE(reportMalformedRow) {
    string path = writeDump("arity.sql.gz", "INSERT INTO `t` VALUES (1,'a'),('b',2);\n");
    SqlDumpReader reader(path, "t");
    SqlRow row;
    int64_t sum = 0;
    while (reader.next(row)) {
      try {
        sum += row[0].asInt64();
      } catch (const RowParseError& error) {
        reader.reportMalformedRow(error);
      }
    }
    WBL_ASSERT_EQ(sum, 1);
    WBL_ASSERT_EQ(reader.rowsRead(), 2);
    WBL_ASSERT_EQ(reader.malformedRows(), 1);
  }

  WBL_TEST_CASE(missingDump) {
    bool exceptionThrown = false;
    try {
      SqlDumpReader reader(m_tempDir.path() + "/missing.sql.gz", "page");
    } catch (const DumpFormatError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
  }

  WBL_TEST_CASE(corruptDump) {
    string content;
    for (int i = 0; i < 5000; i++) {
      content += "INSERT INTO `t` VALUES (" + std::to_string(i) + ",'" + std::to_string(i * 31337) + "');\n";
    }
    string path = writeDump("corrupt.sql.gz", content);
    string compressed = wbl::readFile(path);
    wbl::writeFile(path, compressed.substr(0, compressed.size() / 2));
    SqlDumpReader reader(path, "t");
    SqlRow row;
    bool exceptionThrown = false;
    try {
      while (reader.next(row)) {}
    } catch (const DumpFormatError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
  }

  wbl::TempDir m_tempDir;
};

}  // namespace mwd

int main() {
  mwd::SqlDumpTest().run();
  return 0;
}
