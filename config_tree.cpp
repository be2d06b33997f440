/* Copyright 2023 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
// Narrow query interface onto the hierarchical target configuration and a fixed capacity implementation of it.
#define CONFIG_MODULE "config_tree.cpp"
#include "logging.h"
#include <ctype.h>
#include <errno.h>
#include <fnmatch.h>
#include <stdlib.h>
#include <string.h>
#include <vector>
#include "config_tree.h"


// Forward function declarations.
static char* trimWhitespace(char* pText);
static bool isValidName(const char* pName, size_t nameLength);


ConfigTree::FieldStatus ConfigTree::readU32Field(ConfigNode node, const char* pFieldName, uint32_t* pValue) const
{
    char value[MAX_CONFIG_VALUE_LENGTH + 1];
    if (!readField(node, pFieldName, value, sizeof(value)))
    {
        return FIELD_MISSING;
    }

    char* pText = trimWhitespace(value);
    if (*pText == '\0' || *pText == '-')
    {
        return FIELD_INVALID;
    }

    // Only decimal and 0x prefixed hexadecimal are accepted. A leading 0 doesn't mean octal.
    int base = 10;
    if (pText[0] == '0' && (pText[1] == 'x' || pText[1] == 'X'))
    {
        base = 16;
        pText += 2;
        if (!isxdigit((unsigned char)*pText))
        {
            return FIELD_INVALID;
        }
    }

    char* pEnd = NULL;
    errno = 0;
    unsigned long long parsedValue = strtoull(pText, &pEnd, base);
    if (errno != 0 || *pEnd != '\0' || parsedValue > 0xFFFFFFFFULL)
    {
        return FIELD_INVALID;
    }
    *pValue = (uint32_t)parsedValue;
    return FIELD_FOUND;
}

ConfigTree::FieldStatus ConfigTree::readBoolField(ConfigNode node, const char* pFieldName, bool* pValue) const
{
    char value[MAX_CONFIG_VALUE_LENGTH + 1];
    if (!readField(node, pFieldName, value, sizeof(value)))
    {
        return FIELD_MISSING;
    }

    const char* pText = trimWhitespace(value);
    if (strcmp(pText, "true") == 0 || strcmp(pText, "1") == 0 || strcmp(pText, "yes") == 0)
    {
        *pValue = true;
        return FIELD_FOUND;
    }
    if (strcmp(pText, "false") == 0 || strcmp(pText, "0") == 0 || strcmp(pText, "no") == 0)
    {
        *pValue = false;
        return FIELD_FOUND;
    }
    return FIELD_INVALID;
}



MemoryConfigTree::MemoryConfigTree()
{
    clear();
}

void MemoryConfigTree::clear()
{
    memset(m_nodes, 0, sizeof(m_nodes));
    memset(m_fields, 0, sizeof(m_fields));

    // Node 0 is always the unnamed root of the tree.
    m_nodes[ROOT_NODE].parent = -1;
    m_nodeCount = 1;
    m_fieldCount = 0;
}

ConfigNode MemoryConfigTree::addNode(const char* pPath)
{
    int node = ROOT_NODE;
    const char* pCurr = pPath;

    while (*pCurr)
    {
        const char* pSlash = strchr(pCurr, '/');
        size_t segmentLength = pSlash ? (size_t)(pSlash - pCurr) : strlen(pCurr);
        if (!isValidName(pCurr, segmentLength))
        {
            logErrorF("Invalid node name in path \"%s\".", pPath);
            return NULL;
        }

        int child = findChild(node, pCurr, segmentLength);
        if (child < 0)
        {
            child = addChild(node, pCurr, segmentLength);
            if (child < 0)
            {
                return NULL;
            }
        }
        node = child;

        pCurr += segmentLength;
        if (*pCurr == '/')
        {
            pCurr++;
        }
    }

    if (node == ROOT_NODE)
    {
        logErrorF("Empty node path \"%s\".", pPath);
        return NULL;
    }
    return &m_nodes[node];
}

int MemoryConfigTree::findChild(int parent, const char* pName, size_t nameLength) const
{
    for (size_t i = 1 ; i < m_nodeCount ; i++)
    {
        const Node* pNode = &m_nodes[i];
        if (pNode->parent == parent && strlen(pNode->name) == nameLength && memcmp(pNode->name, pName, nameLength) == 0)
        {
            return (int)i;
        }
    }
    return -1;
}

int MemoryConfigTree::addChild(int parent, const char* pName, size_t nameLength)
{
    if (m_nodeCount >= MAX_CONFIG_NODES)
    {
        logErrorF("Configuration tree is full (%d nodes).", MAX_CONFIG_NODES);
        return -1;
    }
    if (nameLength > MAX_CONFIG_NAME_LENGTH)
    {
        logErrorF("Node name is longer than %d characters.", MAX_CONFIG_NAME_LENGTH);
        return -1;
    }

    Node* pNode = &m_nodes[m_nodeCount];
    memcpy(pNode->name, pName, nameLength);
    pNode->name[nameLength] = '\0';
    pNode->parent = parent;
    return (int)m_nodeCount++;
}

bool MemoryConfigTree::setField(const char* pPath, const char* pFieldName, const char* pValue)
{
    ConfigNode node = addNode(pPath);
    if (!node)
    {
        return false;
    }
    if (!isValidName(pFieldName, strlen(pFieldName)) || strlen(pFieldName) > MAX_CONFIG_NAME_LENGTH)
    {
        logErrorF("Invalid field name \"%s\".", pFieldName);
        return false;
    }
    if (strlen(pValue) > MAX_CONFIG_VALUE_LENGTH)
    {
        logErrorF("Value of field \"%s\" is longer than %d characters.", pFieldName, MAX_CONFIG_VALUE_LENGTH);
        return false;
    }

    int index = nodeIndex(node);
    Field* pField = findField(index, pFieldName);
    if (!pField)
    {
        if (m_fieldCount >= MAX_CONFIG_FIELDS)
        {
            logErrorF("Configuration tree is full (%d fields).", MAX_CONFIG_FIELDS);
            return false;
        }
        pField = &m_fields[m_fieldCount++];
        pField->node = index;
        strcpy(pField->name, pFieldName);
    }
    strcpy(pField->value, pValue);
    return true;
}

bool MemoryConfigTree::parse(const char* pText)
{
    const char* pCurr = pText;
    uint32_t lineNumber = 1;

    while (*pCurr)
    {
        const char* pNewline = strchr(pCurr, '\n');
        size_t lineLength = pNewline ? (size_t)(pNewline - pCurr) : strlen(pCurr);

        char line[MAX_CONFIG_NAME_LENGTH * MAX_CONFIG_DEPTH + MAX_CONFIG_VALUE_LENGTH];
        if (lineLength >= sizeof(line))
        {
            logErrorF("Line %u is too long.", lineNumber);
            return false;
        }
        memcpy(line, pCurr, lineLength);
        line[lineLength] = '\0';

        if (!parseLine(line))
        {
            logErrorF("Failed to parse line %u of configuration text.", lineNumber);
            return false;
        }

        pCurr += lineLength;
        if (*pCurr == '\n')
        {
            pCurr++;
        }
        lineNumber++;
    }
    return true;
}

bool MemoryConfigTree::parseLine(char* pLine)
{
    char* pComment = strchr(pLine, '#');
    if (pComment)
    {
        *pComment = '\0';
    }
    pLine = trimWhitespace(pLine);
    if (*pLine == '\0')
    {
        return true;
    }

    char* pEquals = strchr(pLine, '=');
    if (!pEquals)
    {
        return addNode(pLine) != NULL;
    }

    *pEquals = '\0';
    char* pKey = trimWhitespace(pLine);
    char* pValue = trimWhitespace(pEquals + 1);

    // The field name follows the last '.' found after the last '/' of the key.
    char* pLastSlash = strrchr(pKey, '/');
    char* pDot = strrchr(pLastSlash ? pLastSlash : pKey, '.');
    if (!pDot || pDot == pKey)
    {
        logErrorF("Expected path.field before '=' in \"%s\".", pKey);
        return false;
    }
    *pDot = '\0';
    return setField(pKey, pDot + 1, pValue);
}

bool MemoryConfigTree::loadFile(const char* pFilename)
{
    FILE* pFile = fopen(pFilename, "r");
    if (!pFile)
    {
        logErrorF("Failed to open configuration file \"%s\".", pFilename);
        return false;
    }

    bool result = loadOpenFile(pFile, pFilename);
    fclose(pFile);
    return result;
}

bool MemoryConfigTree::loadOpenFile(FILE* pFile, const char* pFilename)
{
    long fileSize = -1;
    if (fseek(pFile, 0, SEEK_END) == 0)
    {
        fileSize = ftell(pFile);
    }
    if (fileSize < 0 || fseek(pFile, 0, SEEK_SET) != 0)
    {
        logErrorF("Failed to determine size of \"%s\".", pFilename);
        return false;
    }

    std::vector<char> text(fileSize + 1);
    if (fread(text.data(), 1, fileSize, pFile) != (size_t)fileSize)
    {
        logErrorF("Failed to read \"%s\".", pFilename);
        return false;
    }
    text[fileSize] = '\0';

    return parse(text.data());
}

size_t MemoryConfigTree::findNodes(ConfigNode parent, const char* pPattern, ConfigNode* pNodes, size_t maxNodes) const
{
    int parentIndex = nodeIndex(parent);
    if (parentIndex < 0)
    {
        return 0;
    }

    char pattern[MAX_CONFIG_NAME_LENGTH * MAX_CONFIG_DEPTH];
    if (strlen(pPattern) >= sizeof(pattern))
    {
        logErrorF("Pattern \"%s\" is too long.", pPattern);
        return 0;
    }
    strcpy(pattern, pPattern);
    const char* patternSegments[MAX_CONFIG_DEPTH];
    size_t patternCount = splitPattern(pattern, patternSegments, MAX_CONFIG_DEPTH);
    if (patternCount == 0)
    {
        return 0;
    }

    // Visit nodes in creation order so that the results are stable from call to call.
    size_t matchCount = 0;
    for (size_t i = 1 ; i < m_nodeCount ; i++)
    {
        if (!isDescendant((int)i, parentIndex))
        {
            continue;
        }

        const char* pathSegments[MAX_CONFIG_DEPTH];
        size_t pathCount = buildRelativePath((int)i, parentIndex, pathSegments, MAX_CONFIG_DEPTH);
        if (pathCount == 0 || !matchSegments(patternSegments, patternCount, pathSegments, pathCount))
        {
            continue;
        }

        if (matchCount < maxNodes)
        {
            pNodes[matchCount] = &m_nodes[i];
        }
        matchCount++;
    }
    return matchCount;
}

bool MemoryConfigTree::readField(ConfigNode node, const char* pFieldName, char* pValue, size_t valueSize) const
{
    int index = nodeIndex(node);
    if (index < 0)
    {
        return false;
    }
    const Field* pField = findField(index, pFieldName);
    if (!pField || strlen(pField->value) >= valueSize)
    {
        return false;
    }
    strcpy(pValue, pField->value);
    return true;
}

int MemoryConfigTree::nodeIndex(ConfigNode node) const
{
    if (node == NULL)
    {
        return ROOT_NODE;
    }

    const Node* pNode = (const Node*)node;
    if (pNode < &m_nodes[0] || pNode >= &m_nodes[m_nodeCount])
    {
        logError("Node handle doesn't belong to this configuration tree.");
        return -1;
    }
    return (int)(pNode - &m_nodes[0]);
}

bool MemoryConfigTree::isDescendant(int node, int ancestor) const
{
    for (int curr = m_nodes[node].parent ; curr >= 0 ; curr = m_nodes[curr].parent)
    {
        if (curr == ancestor)
        {
            return true;
        }
    }
    return false;
}

size_t MemoryConfigTree::buildRelativePath(int node, int ancestor, const char** ppSegments, size_t maxSegments) const
{
    // Count the levels first so that the segments can be filled in from the top down.
    size_t depth = 0;
    for (int curr = node ; curr != ancestor ; curr = m_nodes[curr].parent)
    {
        depth++;
    }
    if (depth > maxSegments)
    {
        return 0;
    }

    size_t index = depth;
    for (int curr = node ; curr != ancestor ; curr = m_nodes[curr].parent)
    {
        ppSegments[--index] = m_nodes[curr].name;
    }
    return depth;
}

MemoryConfigTree::Field* MemoryConfigTree::findField(int node, const char* pFieldName)
{
    for (size_t i = 0 ; i < m_fieldCount ; i++)
    {
        if (m_fields[i].node == node && strcmp(m_fields[i].name, pFieldName) == 0)
        {
            return &m_fields[i];
        }
    }
    return NULL;
}

const MemoryConfigTree::Field* MemoryConfigTree::findField(int node, const char* pFieldName) const
{
    for (size_t i = 0 ; i < m_fieldCount ; i++)
    {
        if (m_fields[i].node == node && strcmp(m_fields[i].name, pFieldName) == 0)
        {
            return &m_fields[i];
        }
    }
    return NULL;
}

bool MemoryConfigTree::matchSegments(const char* const* ppPattern, size_t patternCount,
                                     const char* const* ppPath, size_t pathCount)
{
    if (patternCount == 0)
    {
        return pathCount == 0;
    }

    if (strcmp(ppPattern[0], "**") == 0)
    {
        // Try letting ** swallow 0, 1, 2... levels of the path.
        for (size_t skip = 0 ; skip <= pathCount ; skip++)
        {
            if (matchSegments(ppPattern + 1, patternCount - 1, ppPath + skip, pathCount - skip))
            {
                return true;
            }
        }
        return false;
    }

    if (pathCount == 0 || fnmatch(ppPattern[0], ppPath[0], 0) != 0)
    {
        return false;
    }
    return matchSegments(ppPattern + 1, patternCount - 1, ppPath + 1, pathCount - 1);
}

size_t MemoryConfigTree::splitPattern(char* pPattern, const char** ppSegments, size_t maxSegments)
{
    size_t count = 0;
    char* pSavePtr = NULL;

    for (char* pToken = strtok_r(pPattern, "/", &pSavePtr) ; pToken ; pToken = strtok_r(NULL, "/", &pSavePtr))
    {
        if (count >= maxSegments)
        {
            return 0;
        }
        ppSegments[count++] = pToken;
    }
    return count;
}



static char* trimWhitespace(char* pText)
{
    while (isspace((unsigned char)*pText))
    {
        pText++;
    }

    char* pEnd = pText + strlen(pText);
    while (pEnd > pText && isspace((unsigned char)pEnd[-1]))
    {
        *--pEnd = '\0';
    }
    return pText;
}

static bool isValidName(const char* pName, size_t nameLength)
{
    if (nameLength == 0)
    {
        return false;
    }
    for (size_t i = 0 ; i < nameLength ; i++)
    {
        char c = pName[i];
        if (c == '/' || c == '=' || c == '#' || isspace((unsigned char)c))
        {
            return false;
        }
    }
    return true;
}
